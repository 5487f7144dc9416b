/********************************************************************
 * gnc-ledger.hpp -- Narrow access layer over a GnuCash book        *
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

/** @file gnc-ledger.hpp
 *  @brief The subset of the engine object model the rollover needs.
 *
 *  A LedgerBackend opens LedgerSessions; each session owns one LedgerBook.
 *  Accounts and transactions are owned by their book and handed out as
 *  plain pointers which stay valid until the book is destroyed or, for
 *  transactions, until LedgerBook::destroy_transaction() is called on them.
 *
 *  Commodities are identified by their unique name, "namespace::mnemonic",
 *  e.g. "CURRENCY::USD".
 */

#ifndef GNC_ROLLOVER_LEDGER_HPP
#define GNC_ROLLOVER_LEDGER_HPP

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <Account.h>
#include <gnc-datetime.hpp>
#include <gnc-numeric.hpp>

namespace GncRollover {

struct LedgerError : public std::runtime_error
{
    LedgerError(const std::string& err) : std::runtime_error(err) {}
};

enum class SessionMode
{
    read_write,
    read_only,
};

class LedgerTransaction;
class LedgerAccount;

using AccountVec = std::vector<LedgerAccount*>;
using TransVec = std::vector<LedgerTransaction*>;

class LedgerAccount
{
public:
    virtual ~LedgerAccount() = default;

    virtual std::string get_name() const = 0;
    virtual std::string get_full_name() const = 0;
    virtual GNCAccountType get_type() const = 0;
    virtual bool get_placeholder() const = 0;
    /** Unique name of the account's commodity, empty if none is set. */
    virtual std::string get_commodity() const = 0;
    virtual GncNumeric get_balance() const = 0;

    /** @name Account tree traversal */
    //@{
    virtual LedgerAccount* get_parent() const = 0;
    virtual AccountVec get_children() const = 0;
    /** All accounts below this one, depth first, parents before children. */
    virtual AccountVec get_descendants() const = 0;
    //@}

    /** Each transaction owning at least one split of this account, once. */
    virtual TransVec get_transactions() const = 0;
};

struct LedgerSplitInfo
{
    LedgerAccount* account;
    GncNumeric amount;
    GncNumeric value;
};

using SplitInfoVec = std::vector<LedgerSplitInfo>;

class LedgerTransaction
{
public:
    virtual ~LedgerTransaction() = default;

    virtual void begin_edit() = 0;
    virtual void commit_edit() = 0;
    /** Undo the changes since begin_edit(). A transaction that was never
     * committed is removed from its book. */
    virtual void rollback_edit() = 0;
    virtual bool is_open() const = 0;

    virtual void set_description(const std::string& description) = 0;
    virtual std::string get_description() const = 0;
    virtual void set_date(const GncDate& date) = 0;
    virtual GncDate get_date() const = 0;
    virtual void set_currency(const std::string& currency) = 0;
    virtual std::string get_currency() const = 0;

    /** Append a split. @a amount is in the account's commodity, @a value in
     * the transaction currency. */
    virtual void add_split(LedgerAccount& account, GncNumeric amount,
                           GncNumeric value) = 0;
    virtual SplitInfoVec get_splits() const = 0;
};

struct LedgerAccountSpec
{
    std::string name;
    GNCAccountType type;
    std::string commodity;
    bool placeholder;
    bool opening_balance;
};

class LedgerBook
{
public:
    virtual ~LedgerBook() = default;

    virtual LedgerAccount* get_root_account() = 0;
    /** @return The account, or nullptr if there is none with that name. */
    virtual LedgerAccount* lookup_account(const std::string& full_name) = 0;
    virtual LedgerAccount* new_account(LedgerAccount& parent,
                                       const LedgerAccountSpec& spec) = 0;

    virtual LedgerTransaction* new_transaction() = 0;
    /** Destroy @a trans and its splits. @a trans is dangling afterwards. */
    virtual void destroy_transaction(LedgerTransaction& trans) = 0;
    /** Number of committed transactions in the book. */
    virtual std::size_t get_transaction_count() const = 0;

    virtual bool has_commodity(const std::string& commodity) const = 0;
    /** Convert @a balance using the price nearest to @a date.
     * @return The converted amount, or zero if no price is available. */
    virtual GncNumeric convert_balance(GncNumeric balance,
                                       const std::string& from,
                                       const std::string& to,
                                       const GncDate& date) const = 0;
    virtual std::string get_separator() const = 0;
};

class LedgerSession
{
public:
    /** Implementations end the session, releasing its lock. */
    virtual ~LedgerSession() = default;

    virtual LedgerBook& get_book() = 0;
    virtual const std::string& get_uri() const noexcept = 0;
    virtual void save() = 0;
    virtual void end() = 0;
};

using LedgerSessionPtr = std::unique_ptr<LedgerSession>;

class LedgerBackend
{
public:
    virtual ~LedgerBackend() = default;

    /** Byte-copy the book stored at @a from to @a to, replacing @a to. */
    virtual void copy_file(const std::string& from, const std::string& to) = 0;
    virtual LedgerSessionPtr open(const std::string& uri, SessionMode mode) = 0;
};

/** Begin-edit/commit bracket around a transaction. The edit is rolled back
 * unless commit() succeeded before the bracket goes out of scope.
 */
class TransactionEdit
{
public:
    explicit TransactionEdit(LedgerTransaction& trans);
    TransactionEdit(const TransactionEdit&) = delete;
    TransactionEdit& operator=(const TransactionEdit&) = delete;
    ~TransactionEdit();

    void commit();

private:
    LedgerTransaction& m_trans;
    bool m_committed = false;
};

} // namespace GncRollover

#endif /* GNC_ROLLOVER_LEDGER_HPP */
