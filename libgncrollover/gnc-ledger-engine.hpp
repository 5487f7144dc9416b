/********************************************************************
 * gnc-ledger-engine.hpp -- Ledger backend on the GnuCash engine    *
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

/** @file gnc-ledger-engine.hpp
 *  @brief Wrappers of the engine's Account, Transaction, QofBook and
 *  QofSession behind the ledger interface.
 *
 *  Unfortunately the wrappers have no information about whether the
 *  underlying engine objects are still alive; they must not outlive the
 *  GncEngineBook that created them.
 */

#ifndef GNC_ROLLOVER_LEDGER_ENGINE_HPP
#define GNC_ROLLOVER_LEDGER_ENGINE_HPP

#include <unordered_map>

#include <qof.h>
#include <Transaction.h>

#include "gnc-ledger.hpp"

namespace GncRollover {

class GncEngineBook;

class GncEngineAccount final : public LedgerAccount
{
public:
    GncEngineAccount(GncEngineBook& book, ::Account* acct) :
        m_book{book}, m_acct{acct} {}

    std::string get_name() const override;
    std::string get_full_name() const override;
    GNCAccountType get_type() const override;
    bool get_placeholder() const override;
    std::string get_commodity() const override;
    GncNumeric get_balance() const override;
    LedgerAccount* get_parent() const override;
    AccountVec get_children() const override;
    AccountVec get_descendants() const override;
    TransVec get_transactions() const override;

    ::Account* gobj() const noexcept { return m_acct; }

private:
    GncEngineBook& m_book;
    ::Account* m_acct;
};

class GncEngineTransaction final : public LedgerTransaction
{
public:
    /** @param committed false for a transaction fresh from
     * xaccMallocTransaction which has never been committed. */
    GncEngineTransaction(GncEngineBook& book, ::Transaction* trans,
                         bool committed = true) :
        m_book{book}, m_trans{trans}, m_committed{committed} {}

    void begin_edit() override;
    void commit_edit() override;
    void rollback_edit() override;
    bool is_open() const override;

    void set_description(const std::string& description) override;
    std::string get_description() const override;
    void set_date(const GncDate& date) override;
    GncDate get_date() const override;
    void set_currency(const std::string& currency) override;
    std::string get_currency() const override;
    void add_split(LedgerAccount& account, GncNumeric amount,
                   GncNumeric value) override;
    SplitInfoVec get_splits() const override;

    ::Transaction* gobj() const noexcept { return m_trans; }

private:
    GncEngineBook& m_book;
    ::Transaction* m_trans;
    bool m_committed;
};

class GncEngineBook final : public LedgerBook
{
public:
    explicit GncEngineBook(QofBook* book) : m_book{book} {}
    GncEngineBook(const GncEngineBook&) = delete;
    GncEngineBook& operator=(const GncEngineBook&) = delete;

    LedgerAccount* get_root_account() override;
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
    std::string get_separator() const override;

    QofBook* gobj() const noexcept { return m_book; }

    /** The wrapper of @a acct, created on first use. nullptr for nullptr. */
    GncEngineAccount* wrap(::Account* acct);
    GncEngineTransaction* wrap(::Transaction* trans);
    /** Drop the wrapper of a transaction the engine has freed. */
    void forget(const ::Transaction* trans);

    gnc_commodity* lookup_commodity(const std::string& commodity) const;
    ::Account* unwrap(LedgerAccount& account) const;

private:
    QofBook* m_book;
    std::unordered_map<const ::Account*, std::unique_ptr<GncEngineAccount>> m_accounts;
    std::unordered_map<const ::Transaction*, std::unique_ptr<GncEngineTransaction>> m_transactions;
};

class GncEngineSession final : public LedgerSession
{
public:
    GncEngineSession(QofSession* session, std::string uri);
    GncEngineSession(const GncEngineSession&) = delete;
    GncEngineSession& operator=(const GncEngineSession&) = delete;
    ~GncEngineSession() override;

    LedgerBook& get_book() override;
    const std::string& get_uri() const noexcept override { return m_uri; }
    void save() override;
    void end() override;

private:
    QofSession* m_session;
    std::string m_uri;
    std::unique_ptr<GncEngineBook> m_book;
};

/** Opens book files through the engine's registered backends. The engine
 * must have been initialized with gnc_engine_init().
 */
class GncEngineBackend final : public LedgerBackend
{
public:
    void copy_file(const std::string& from, const std::string& to) override;
    LedgerSessionPtr open(const std::string& uri, SessionMode mode) override;
};

} // namespace GncRollover

#endif /* GNC_ROLLOVER_LEDGER_ENGINE_HPP */
