/********************************************************************
 * gnc-ledger-memory.hpp -- In-process ledger backend               *
 * Copyright (C) 2025 gnucash-rollover contributors                 *
 *                                                                  *
 * This program is free software; you can redistribute it and/or    *
 * modify it under the terms of the GNU General Public License as   *
 * published by the Free Software Foundation; either version 2 of   *
 * the License, or (at your option) any later version.              *
 *                                                                  *
 * This program is distributed in the hope that it will be useful,  *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of   *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the    *
 * GNU General Public License for more details.                     *
 *                                                                  *
 * You should have received a copy of the GNU General Public License*
 * along with this program; if not, contact:                        *
 *                                                                  *
 * Free Software Foundation           Voice:  +1-617-542-5942       *
 * 51 Franklin Street, Fifth Floor    Fax:    +1-617-542-2652       *
 * Boston, MA  02110-1301,  USA       gnu@gnu.org                   *
 *                                                                  *
 *******************************************************************/

/** @file gnc-ledger-memory.hpp
 *  @brief A ledger backend keeping its books in memory.
 *
 *  The backend stores books under URIs the way a file system stores book
 *  files. A session works on a private copy of the stored book which is
 *  written back only by LedgerSession::save(), so unsaved work is lost when
 *  the session ends, just as with a file backed session.
 */

#ifndef GNC_ROLLOVER_LEDGER_MEMORY_HPP
#define GNC_ROLLOVER_LEDGER_MEMORY_HPP

#include <map>
#include <set>

#include "gnc-ledger.hpp"

namespace GncRollover {

class GncMemoryBook;

class GncMemoryAccount final : public LedgerAccount
{
public:
    GncMemoryAccount(GncMemoryBook& book, GncMemoryAccount* parent,
                     const LedgerAccountSpec& spec);

    std::string get_name() const override { return m_name; }
    std::string get_full_name() const override;
    GNCAccountType get_type() const override { return m_type; }
    bool get_placeholder() const override { return m_placeholder; }
    std::string get_commodity() const override { return m_commodity; }
    GncNumeric get_balance() const override;
    LedgerAccount* get_parent() const override { return m_parent; }
    AccountVec get_children() const override;
    AccountVec get_descendants() const override;
    TransVec get_transactions() const override;

    bool get_opening_balance() const noexcept { return m_opening_balance; }
    GncMemoryAccount* find_child(const std::string& name) const;

private:
    friend class GncMemoryBook;

    GncMemoryBook& m_book;
    GncMemoryAccount* m_parent;
    std::string m_name;
    GNCAccountType m_type;
    std::string m_commodity;
    bool m_placeholder;
    bool m_opening_balance;
    std::vector<std::unique_ptr<GncMemoryAccount>> m_children;
};

class GncMemoryTransaction final : public LedgerTransaction
{
public:
    explicit GncMemoryTransaction(GncMemoryBook& book) : m_book{book} {}

    void begin_edit() override;
    void commit_edit() override;
    void rollback_edit() override;
    bool is_open() const override { return m_edit_level > 0; }

    void set_description(const std::string& description) override;
    std::string get_description() const override { return m_state.description; }
    void set_date(const GncDate& date) override;
    GncDate get_date() const override { return m_state.date; }
    void set_currency(const std::string& currency) override;
    std::string get_currency() const override { return m_state.currency; }
    void add_split(LedgerAccount& account, GncNumeric amount,
                   GncNumeric value) override;
    SplitInfoVec get_splits() const override { return m_state.splits; }

    bool is_committed() const noexcept { return m_committed; }
    /** The splits as of the last commit. */
    const SplitInfoVec& committed_splits() const noexcept;

private:
    friend class GncMemoryBook;

    struct State
    {
        std::string description;
        GncDate date;
        std::string currency;
        SplitInfoVec splits;
    };

    void check_open(const char* what) const;

    GncMemoryBook& m_book;
    int m_edit_level = 0;
    bool m_committed = false;
    State m_state;
    State m_saved;
};

class GncMemoryBook final : public LedgerBook
{
public:
    explicit GncMemoryBook(std::string separator = ":");
    GncMemoryBook(const GncMemoryBook&) = delete;
    GncMemoryBook& operator=(const GncMemoryBook&) = delete;

    /** Deep copy of the accounts, committed transactions, commodities and
     * prices. */
    std::unique_ptr<GncMemoryBook> clone() const;

    LedgerAccount* get_root_account() override { return m_root.get(); }
    LedgerAccount* lookup_account(const std::string& full_name) override;
    LedgerAccount* new_account(LedgerAccount& parent,
                               const LedgerAccountSpec& spec) override;
    LedgerTransaction* new_transaction() override;
    void destroy_transaction(LedgerTransaction& trans) override;
    std::size_t get_transaction_count() const override;
    bool has_commodity(const std::string& commodity) const override;
    GncNumeric convert_balance(GncNumeric balance, const std::string& from,
                               const std::string& to,
                               const GncDate& date) const override;
    std::string get_separator() const override { return m_separator; }

    void add_commodity(const std::string& commodity, int64_t fraction);
    void add_price(const std::string& commodity, const std::string& currency,
                   const GncDate& date, GncNumeric value);

private:
    friend class GncMemoryAccount;
    friend class GncMemoryTransaction;

    struct Price
    {
        std::string commodity;
        std::string currency;
        time64 time;
        GncNumeric value;
    };

    GncMemoryAccount* find_account(const std::string& full_name) const;
    GncMemoryAccount* own_account(LedgerAccount& account) const;
    void remove_transaction(const LedgerTransaction* trans);

    std::string m_separator;
    std::unique_ptr<GncMemoryAccount> m_root;
    std::vector<std::unique_ptr<GncMemoryTransaction>> m_transactions;
    std::map<std::string, int64_t> m_commodities;
    std::vector<Price> m_prices;
};

class GncMemoryBackend final : public LedgerBackend
{
public:
    GncMemoryBackend() = default;
    GncMemoryBackend(const GncMemoryBackend&) = delete;
    GncMemoryBackend& operator=(const GncMemoryBackend&) = delete;

    /** Store a new, empty book under @a uri, replacing any existing one. */
    GncMemoryBook& add_book(const std::string& uri,
                            const std::string& separator = ":");
    /** The stored (last saved) book, or nullptr. */
    GncMemoryBook* get_book(const std::string& uri) const;
    /** Refuse copies, saves and read-write sessions for @a uri. */
    void set_writable(const std::string& uri, bool writable);
    bool is_locked(const std::string& uri) const;
    std::size_t get_session_count() const noexcept { return m_sessions; }

    void copy_file(const std::string& from, const std::string& to) override;
    LedgerSessionPtr open(const std::string& uri, SessionMode mode) override;

private:
    friend class GncMemorySession;

    void store(const std::string& uri, const GncMemoryBook& book);
    void release(const std::string& uri, SessionMode mode);

    std::map<std::string, std::unique_ptr<GncMemoryBook>> m_books;
    std::set<std::string> m_readonly;
    std::set<std::string> m_locked;
    std::size_t m_sessions = 0;
};

} // namespace GncRollover

#endif /* GNC_ROLLOVER_LEDGER_MEMORY_HPP */
