/********************************************************************
 * gnc-rollover.hpp -- Start a new fiscal year book                 *
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

/** @file gnc-rollover.hpp
 *  @brief Create the book of a new fiscal year from the previous year's book.
 *
 *  The previous book is copied, the copy is emptied of transactions and one
 *  opening transaction per asset and liability account restores the closing
 *  balances of the previous year against an opening balance equity account.
 */

#ifndef GNC_ROLLOVER_ROLLOVER_HPP
#define GNC_ROLLOVER_ROLLOVER_HPP

#include <map>

#include "gnc-ledger.hpp"

namespace GncRollover {

using AccountTypeVec = std::vector<GNCAccountType>;

/** Top-level account types whose descendants get opening transactions. */
extern const AccountTypeVec default_account_types;

struct AccountBalance
{
    std::string full_name;
    GNCAccountType type;
    std::string commodity;
    GncNumeric balance;
};

/** Closing balances keyed by full account name. */
using AccountBalanceMap = std::map<std::string, AccountBalance>;

struct EquityAccounts
{
    LedgerAccount* placeholder;
    LedgerAccount* opening;
    std::size_t created;
};

struct RolloverParams
{
    std::string previous_file;
    std::string new_file;
    std::string equity_name{"Equity"};
    std::string opening_name{"Opening balance"};
    std::string description{"Opening balance"};
    GncDate opening_date{2025, 1, 1};
    /** ISO 4217 code of a newly created opening balance account. */
    std::string currency{"USD"};
};

struct RolloverSummary
{
    std::size_t deleted = 0;
    std::size_t balances = 0;
    std::size_t skipped_zero = 0;
    std::size_t created_accounts = 0;
    std::size_t created_transactions = 0;
};

/** Parse an ISO-8601 calendar date. A time part following a 'T' is ignored.
 * @exception LedgerError if the date can't be parsed.
 */
GncDate parse_opening_date(const std::string& date);

/** Unique commodity name of the currency with ISO 4217 code @a code. */
std::string currency_unique_name(const std::string& code);

/** Destroy every transaction with a split in any account of @a book.
 * @return The number of transactions destroyed.
 */
std::size_t delete_all_transactions(LedgerBook& book);

/** Copy @a previous_file to @a new_file and remove all transactions from the
 * copy. No session is opened if the copy fails.
 * @param n_deleted If not null, receives the number of deleted transactions.
 * @return The read-write session on @a new_file.
 */
LedgerSessionPtr prepare_new_year_file(LedgerBackend& backend,
                                       const std::string& previous_file,
                                       const std::string& new_file,
                                       std::size_t* n_deleted = nullptr);

/** The balances of all non-placeholder accounts below the top-level accounts
 * whose type is in @a account_types. Zero balances are included. */
AccountBalanceMap get_account_balances(LedgerBook& book,
                                       const AccountTypeVec& account_types = default_account_types);

/** Find or create the top-level placeholder equity account @a equity_name and
 * the opening balance account @a opening_name below it.
 * @param currency ISO 4217 code used for accounts which have to be created.
 */
EquityAccounts ensure_equity_accounts(LedgerBook& book,
                                      const std::string& equity_name,
                                      const std::string& opening_name,
                                      const std::string& currency);

/** Find the account @a balance belongs to, creating it and any missing
 * ancestors. Missing ancestors copy type, commodity and placeholder flag from
 * the account of the same name in @a previous if there is one.
 * @param n_created Incremented for each account created.
 */
LedgerAccount& ensure_account(LedgerBook& book, const AccountBalance& balance,
                              LedgerBook* previous, std::size_t& n_created);

/** Create one transaction for each nonzero balance moving it from @a opening
 * into its account. The transactions use the commodity of @a opening as
 * currency; balances in other commodities are converted with the price
 * nearest to @a date.
 * @exception LedgerError if a balance can't be converted. Transactions
 * created before the failure remain in the book.
 * @param previous The previous year's book, used by ensure_account().
 * @param n_created_accounts If not null, incremented for each account created.
 * @return The new transactions.
 */
TransVec create_opening_transactions(LedgerBook& book,
                                     const AccountBalanceMap& balances,
                                     LedgerAccount& opening,
                                     const std::string& description,
                                     const GncDate& date,
                                     LedgerBook* previous = nullptr,
                                     std::size_t* n_created_accounts = nullptr);

class Rollover
{
public:
    Rollover(LedgerBackend& backend, RolloverParams params) :
        m_backend{backend}, m_params{std::move(params)} {}

    /** Run all steps and save the new book. Both sessions are ended when
     * run() returns or throws. A failure skips the explicit save, but a
     * backend which writes on every commit (sqlite3) has already stored the
     * deletions and any opening transactions made before it, so the new file
     * may be left partially modified. */
    const RolloverSummary& run();
    const RolloverSummary& summary() const noexcept { return m_summary; }

private:
    LedgerBackend& m_backend;
    RolloverParams m_params;
    RolloverSummary m_summary;
};

} // namespace GncRollover

#endif /* GNC_ROLLOVER_ROLLOVER_HPP */
