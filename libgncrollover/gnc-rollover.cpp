/********************************************************************
 * gnc-rollover.cpp -- Start a new fiscal year book                 *
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

#include <config.h>
#include <qoflog.h>
#include <gnc-commodity.h>

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/locale.hpp>

#include "gnc-rollover.hpp"

static const QofLogModule log_module = "gnc.rollover";

namespace bl = boost::locale;

namespace GncRollover {

const AccountTypeVec default_account_types{ACCT_TYPE_ASSET, ACCT_TYPE_LIABILITY};

GncDate
parse_opening_date(const std::string& date)
{
    auto day_part = date.substr(0, date.find('T'));
    try
    {
        return GncDate(day_part, "y-m-d");
    }
    catch (const std::logic_error& err)
    {
        throw LedgerError((bl::format(bl::translate("Invalid opening date {1}: {2}"))
                           % date % err.what()).str());
    }
}

std::string
currency_unique_name(const std::string& code)
{
    return std::string{GNC_COMMODITY_NS_CURRENCY} + "::" + code;
}

std::size_t
delete_all_transactions(LedgerBook& book)
{
    std::size_t n_deleted = 0;
    for (auto acct : book.get_root_account()->get_descendants())
    {
        for (auto trans : acct->get_transactions())
        {
            DEBUG ("destroying \"%s\" from %s", trans->get_description().c_str(),
                   acct->get_full_name().c_str());
            book.destroy_transaction(*trans);
            ++n_deleted;
        }
    }
    return n_deleted;
}

LedgerSessionPtr
prepare_new_year_file(LedgerBackend& backend, const std::string& previous_file,
                      const std::string& new_file, std::size_t* n_deleted)
{
    PINFO ("copying previous year's file %s to new file %s",
           previous_file.c_str(), new_file.c_str());
    backend.copy_file(previous_file, new_file);

    auto session = backend.open(new_file, SessionMode::read_write);
    auto deleted = delete_all_transactions(session->get_book());
    PINFO ("deleted %zu transactions from %s", deleted, new_file.c_str());
    if (n_deleted)
        *n_deleted = deleted;
    return session;
}

AccountBalanceMap
get_account_balances(LedgerBook& book, const AccountTypeVec& account_types)
{
    AccountBalanceMap balances;
    for (auto top : book.get_root_account()->get_children())
    {
        if (std::find(account_types.begin(), account_types.end(),
                      top->get_type()) == account_types.end())
            continue;

        for (auto acct : top->get_descendants())
        {
            if (acct->get_placeholder())
                continue;
            auto full_name = acct->get_full_name();
            auto balance = acct->get_balance();
            DEBUG ("%s: %s", full_name.c_str(), balance.to_string().c_str());
            balances.emplace(full_name, AccountBalance{full_name, acct->get_type(),
                                                       acct->get_commodity(),
                                                       balance});
        }
    }
    return balances;
}

EquityAccounts
ensure_equity_accounts(LedgerBook& book, const std::string& equity_name,
                       const std::string& opening_name,
                       const std::string& currency)
{
    EquityAccounts equity{nullptr, nullptr, 0};
    auto commodity = currency_unique_name(currency);
    auto check_currency = [&book, &commodity]()
    {
        if (!book.has_commodity(commodity))
            throw LedgerError((bl::format(bl::translate("Unknown currency {1}."))
                               % commodity).str());
    };

    PINFO ("looking up %s", equity_name.c_str());
    equity.placeholder = book.lookup_account(equity_name);
    if (!equity.placeholder)
    {
        check_currency();
        PINFO ("creating account %s", equity_name.c_str());
        equity.placeholder = book.new_account(*book.get_root_account(),
                                              {equity_name, ACCT_TYPE_EQUITY,
                                               commodity, true, false});
        ++equity.created;
    }

    auto opening_full_name = equity_name + book.get_separator() + opening_name;
    PINFO ("looking up %s", opening_full_name.c_str());
    equity.opening = book.lookup_account(opening_full_name);
    if (!equity.opening)
    {
        check_currency();
        PINFO ("creating account %s", opening_full_name.c_str());
        equity.opening = book.new_account(*equity.placeholder,
                                          {opening_name, ACCT_TYPE_EQUITY,
                                           commodity, false, true});
        ++equity.created;
    }
    else if (equity.opening->get_commodity().empty())
    {
        throw LedgerError((bl::format(bl::translate("Opening balance account {1} has no commodity."))
                           % opening_full_name).str());
    }
    else if (equity.opening->get_commodity() != commodity)
    {
        PWARN ("%s exists with commodity %s, using it instead of %s",
               opening_full_name.c_str(), equity.opening->get_commodity().c_str(),
               commodity.c_str());
    }
    return equity;
}

LedgerAccount&
ensure_account(LedgerBook& book, const AccountBalance& balance,
               LedgerBook* previous, std::size_t& n_created)
{
    if (auto acct = book.lookup_account(balance.full_name))
        return *acct;

    auto separator = book.get_separator();
    std::vector<std::string> names;
    boost::algorithm::iter_split(names, balance.full_name,
                                 boost::algorithm::first_finder(separator));

    auto parent = book.get_root_account();
    std::string full_name;
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        full_name = i ? full_name + separator + names[i] : names[i];
        if (auto acct = book.lookup_account(full_name))
        {
            parent = acct;
            continue;
        }

        LedgerAccountSpec spec{names[i], balance.type, balance.commodity, false, false};
        auto is_leaf = i + 1 == names.size();
        auto template_acct = (previous && !is_leaf) ?
            previous->lookup_account(full_name) : nullptr;
        if (template_acct)
        {
            spec.type = template_acct->get_type();
            spec.commodity = template_acct->get_commodity();
            spec.placeholder = template_acct->get_placeholder();
        }
        PINFO ("creating account %s", full_name.c_str());
        parent = book.new_account(*parent, spec);
        ++n_created;
    }
    return *parent;
}

TransVec
create_opening_transactions(LedgerBook& book, const AccountBalanceMap& balances,
                            LedgerAccount& opening, const std::string& description,
                            const GncDate& date, LedgerBook* previous,
                            std::size_t* n_created_accounts)
{
    TransVec transactions;
    std::size_t n_created = 0;
    auto currency = opening.get_commodity();

    for (const auto& entry : balances)
    {
        const auto& balance = entry.second;
        if (balance.balance.num() == 0)
        {
            DEBUG ("skipping %s, balance is zero", entry.first.c_str());
            continue;
        }

        PINFO ("creating opening balance for account %s", entry.first.c_str());
        auto& acct = ensure_account(book, balance, previous, n_created);

        auto commodity = acct.get_commodity();
        auto value = balance.balance;
        if (commodity != currency)
        {
            value = book.convert_balance(balance.balance, commodity, currency, date);
            if (value.num() == 0)
                throw LedgerError((bl::format(bl::translate("No price to convert the balance {1} of {2} from {3} to {4}."))
                                   % balance.balance.to_string() % entry.first
                                   % commodity % currency).str());
            DEBUG ("converted %s %s to %s %s", balance.balance.to_string().c_str(),
                   commodity.c_str(), value.to_string().c_str(), currency.c_str());
        }

        auto trans = book.new_transaction();
        TransactionEdit edit{*trans};
        trans->set_currency(currency);
        trans->set_description(description);
        trans->set_date(date);
        trans->add_split(acct, balance.balance, value);
        trans->add_split(opening, -value, -value);
        edit.commit();
        transactions.push_back(trans);
    }
    if (n_created_accounts)
        *n_created_accounts += n_created;
    return transactions;
}

const RolloverSummary&
Rollover::run()
{
    m_summary = RolloverSummary{};

    auto session_new = prepare_new_year_file(m_backend, m_params.previous_file,
                                             m_params.new_file, &m_summary.deleted);

    PINFO ("reading balances from previous year's file %s",
           m_params.previous_file.c_str());
    auto session_prev = m_backend.open(m_params.previous_file, SessionMode::read_only);
    auto& book_prev = session_prev->get_book();
    auto balances = get_account_balances(book_prev);
    m_summary.balances = balances.size();
    m_summary.skipped_zero = std::count_if(balances.begin(), balances.end(),
                                           [](const auto& entry)
                                           { return entry.second.balance.num() == 0; });

    PINFO ("preparing opening balances counter account in new year's file");
    auto& book_new = session_new->get_book();
    auto equity = ensure_equity_accounts(book_new, m_params.equity_name,
                                         m_params.opening_name, m_params.currency);
    m_summary.created_accounts = equity.created;

    auto transactions = create_opening_transactions(book_new, balances, *equity.opening,
                                                    m_params.description,
                                                    m_params.opening_date, &book_prev,
                                                    &m_summary.created_accounts);
    m_summary.created_transactions = transactions.size();

    PINFO ("saving new year's file %s", m_params.new_file.c_str());
    session_new->save();
    session_new->end();
    session_prev->end();
    return m_summary;
}

} // namespace GncRollover
