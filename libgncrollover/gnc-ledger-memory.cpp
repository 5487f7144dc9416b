/********************************************************************
 * gnc-ledger-memory.cpp -- In-process ledger backend               *
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

#include <algorithm>
#include <unordered_map>
#include <boost/algorithm/string.hpp>
#include <boost/locale.hpp>

#include "gnc-ledger-memory.hpp"

static const QofLogModule log_module = "gnc.rollover.memory";

namespace bl = boost::locale;

namespace GncRollover {

using AccountMap = std::unordered_map<const LedgerAccount*, LedgerAccount*>;

/* ISO 4217 currencies every new book knows about, with their smallest
 * fraction. */
static const std::map<std::string, int64_t> default_currencies
{
    {"CURRENCY::USD", 100},
    {"CURRENCY::EUR", 100},
    {"CURRENCY::GBP", 100},
    {"CURRENCY::CHF", 100},
    {"CURRENCY::CAD", 100},
    {"CURRENCY::JPY", 1},
};

static LedgerAccountSpec
root_account_spec()
{
    return {"Root Account", ACCT_TYPE_ROOT, "", false, false};
}

GncMemoryAccount::GncMemoryAccount(GncMemoryBook& book, GncMemoryAccount* parent,
                                   const LedgerAccountSpec& spec) :
    m_book{book}, m_parent{parent}, m_name{spec.name}, m_type{spec.type},
    m_commodity{spec.commodity}, m_placeholder{spec.placeholder},
    m_opening_balance{spec.opening_balance}
{
}

std::string
GncMemoryAccount::get_full_name() const
{
    if (!m_parent)
        return "";
    std::vector<std::string> names;
    for (auto acct = this; acct->m_parent; acct = acct->m_parent)
        names.push_back(acct->m_name);
    std::reverse(names.begin(), names.end());
    return boost::algorithm::join(names, m_book.m_separator);
}

GncNumeric
GncMemoryAccount::get_balance() const
{
    GncNumeric balance;
    for (const auto& trans : m_book.m_transactions)
    {
        if (!trans->is_committed())
            continue;
        for (const auto& split : trans->committed_splits())
            if (split.account == this)
                balance += split.amount;
    }
    return balance;
}

AccountVec
GncMemoryAccount::get_children() const
{
    AccountVec children;
    for (const auto& child : m_children)
        children.push_back(child.get());
    return children;
}

AccountVec
GncMemoryAccount::get_descendants() const
{
    AccountVec descendants;
    for (const auto& child : m_children)
    {
        descendants.push_back(child.get());
        auto below{child->get_descendants()};
        descendants.insert(descendants.end(), below.begin(), below.end());
    }
    return descendants;
}

TransVec
GncMemoryAccount::get_transactions() const
{
    TransVec transactions;
    for (const auto& trans : m_book.m_transactions)
    {
        if (!trans->is_committed())
            continue;
        const auto& splits{trans->committed_splits()};
        if (std::any_of(splits.begin(), splits.end(),
                        [this](const auto& split){ return split.account == this; }))
            transactions.push_back(trans.get());
    }
    return transactions;
}

GncMemoryAccount*
GncMemoryAccount::find_child(const std::string& name) const
{
    auto iter = std::find_if(m_children.begin(), m_children.end(),
                             [&name](const auto& child){ return child->m_name == name; });
    return iter == m_children.end() ? nullptr : iter->get();
}

void
GncMemoryTransaction::check_open(const char* what) const
{
    if (m_edit_level <= 0)
        throw LedgerError((bl::format(bl::translate("Cannot {1}: transaction is not open for editing."))
                           % what).str());
}

const SplitInfoVec&
GncMemoryTransaction::committed_splits() const noexcept
{
    return m_edit_level > 0 ? m_saved.splits : m_state.splits;
}

void
GncMemoryTransaction::begin_edit()
{
    if (m_edit_level++ == 0)
        m_saved = m_state;
}

void
GncMemoryTransaction::commit_edit()
{
    check_open("commit");
    if (m_edit_level > 1)
    {
        --m_edit_level;
        return;
    }

    if (m_state.currency.empty())
        throw LedgerError(bl::translate("Cannot commit a transaction without a currency."));
    if (!m_book.has_commodity(m_state.currency))
        throw LedgerError((bl::format(bl::translate("Unknown transaction currency {1}."))
                           % m_state.currency).str());

    GncNumeric imbalance;
    for (const auto& split : m_state.splits)
        imbalance += split.value;
    if (imbalance.num() != 0)
        throw LedgerError((bl::format(bl::translate("Transaction \"{1}\" is unbalanced by {2}."))
                           % m_state.description % imbalance.to_string()).str());

    m_edit_level = 0;
    m_committed = true;
    DEBUG ("committed \"%s\" with %zu splits", m_state.description.c_str(),
           m_state.splits.size());
}

void
GncMemoryTransaction::rollback_edit()
{
    check_open("roll back");
    m_edit_level = 0;
    if (m_committed)
    {
        m_state = m_saved;
        return;
    }
    /* A never-committed transaction has nothing to return to. This
     * destroys *this and must stay the last statement. */
    m_book.remove_transaction(this);
}

void
GncMemoryTransaction::set_description(const std::string& description)
{
    check_open("set the description");
    m_state.description = description;
}

void
GncMemoryTransaction::set_date(const GncDate& date)
{
    check_open("set the date");
    m_state.date = date;
}

void
GncMemoryTransaction::set_currency(const std::string& currency)
{
    check_open("set the currency");
    m_state.currency = currency;
}

void
GncMemoryTransaction::add_split(LedgerAccount& account, GncNumeric amount,
                                GncNumeric value)
{
    check_open("add a split");
    m_state.splits.push_back({m_book.own_account(account), amount, value});
}

GncMemoryBook::GncMemoryBook(std::string separator) :
    m_separator{std::move(separator)},
    m_root{std::make_unique<GncMemoryAccount>(*this, nullptr, root_account_spec())},
    m_commodities{default_currencies}
{
}

static void
clone_children(const GncMemoryAccount& from, GncMemoryBook& book,
               LedgerAccount& to, AccountMap& account_map)
{
    for (auto child : from.get_children())
    {
        auto acct = static_cast<const GncMemoryAccount*>(child);
        LedgerAccountSpec spec{acct->get_name(), acct->get_type(),
                               acct->get_commodity(), acct->get_placeholder(),
                               acct->get_opening_balance()};
        auto copy = book.new_account(to, spec);
        account_map.emplace(acct, copy);
        clone_children(*acct, book, *copy, account_map);
    }
}

std::unique_ptr<GncMemoryBook>
GncMemoryBook::clone() const
{
    auto book{std::make_unique<GncMemoryBook>(m_separator)};
    book->m_commodities = m_commodities;
    book->m_prices = m_prices;

    AccountMap account_map{{m_root.get(), book->m_root.get()}};
    clone_children(*m_root, *book, *book->m_root, account_map);

    for (const auto& trans : m_transactions)
    {
        if (!trans->is_committed())
            continue;
        auto copy{std::make_unique<GncMemoryTransaction>(*book)};
        copy->m_state.description = trans->m_state.description;
        copy->m_state.date = trans->m_state.date;
        copy->m_state.currency = trans->m_state.currency;
        for (const auto& split : trans->committed_splits())
            copy->m_state.splits.push_back({account_map.at(split.account),
                                            split.amount, split.value});
        copy->m_committed = true;
        book->m_transactions.push_back(std::move(copy));
    }
    return book;
}

GncMemoryAccount*
GncMemoryBook::find_account(const std::string& full_name) const
{
    if (full_name.empty())
        return nullptr;
    std::vector<std::string> names;
    boost::algorithm::iter_split(names, full_name,
                                 boost::algorithm::first_finder(m_separator));
    auto acct = m_root.get();
    for (const auto& name : names)
    {
        acct = acct->find_child(name);
        if (!acct)
            return nullptr;
    }
    return acct;
}

GncMemoryAccount*
GncMemoryBook::own_account(LedgerAccount& account) const
{
    auto acct = dynamic_cast<GncMemoryAccount*>(&account);
    if (!acct || &acct->m_book != this)
        throw LedgerError((bl::format(bl::translate("Account {1} does not belong to this book."))
                           % account.get_full_name()).str());
    return acct;
}

LedgerAccount*
GncMemoryBook::lookup_account(const std::string& full_name)
{
    return find_account(full_name);
}

LedgerAccount*
GncMemoryBook::new_account(LedgerAccount& parent, const LedgerAccountSpec& spec)
{
    auto parent_acct = own_account(parent);
    if (spec.name.empty() || spec.name.find(m_separator) != std::string::npos)
        throw LedgerError((bl::format(bl::translate("Invalid account name \"{1}\"."))
                           % spec.name).str());
    if (parent_acct->find_child(spec.name))
        throw LedgerError((bl::format(bl::translate("Account {1} already has a child named {2}."))
                           % parent_acct->get_full_name() % spec.name).str());
    if (!spec.commodity.empty() && !has_commodity(spec.commodity))
        throw LedgerError((bl::format(bl::translate("Unknown commodity {1}."))
                           % spec.commodity).str());

    parent_acct->m_children.push_back(std::make_unique<GncMemoryAccount>(*this, parent_acct, spec));
    return parent_acct->m_children.back().get();
}

LedgerTransaction*
GncMemoryBook::new_transaction()
{
    m_transactions.push_back(std::make_unique<GncMemoryTransaction>(*this));
    return m_transactions.back().get();
}

void
GncMemoryBook::remove_transaction(const LedgerTransaction* trans)
{
    auto iter = std::find_if(m_transactions.begin(), m_transactions.end(),
                             [trans](const auto& t){ return t.get() == trans; });
    if (iter == m_transactions.end())
        throw LedgerError(bl::translate("Transaction does not belong to this book."));
    m_transactions.erase(iter);
}

void
GncMemoryBook::destroy_transaction(LedgerTransaction& trans)
{
    remove_transaction(&trans);
}

std::size_t
GncMemoryBook::get_transaction_count() const
{
    return std::count_if(m_transactions.begin(), m_transactions.end(),
                         [](const auto& trans){ return trans->is_committed(); });
}

bool
GncMemoryBook::has_commodity(const std::string& commodity) const
{
    return m_commodities.find(commodity) != m_commodities.end();
}

void
GncMemoryBook::add_commodity(const std::string& commodity, int64_t fraction)
{
    if (commodity.find("::") == std::string::npos || fraction <= 0)
        throw LedgerError((bl::format(bl::translate("Invalid commodity {1}."))
                           % commodity).str());
    m_commodities[commodity] = fraction;
}

void
GncMemoryBook::add_price(const std::string& commodity, const std::string& currency,
                         const GncDate& date, GncNumeric value)
{
    if (!has_commodity(commodity) || !has_commodity(currency))
        throw LedgerError((bl::format(bl::translate("Cannot add a price for {1} in {2}."))
                           % commodity % currency).str());
    m_prices.push_back({commodity, currency,
                        static_cast<time64>(GncDateTime(date)), value});
}

GncNumeric
GncMemoryBook::convert_balance(GncNumeric balance, const std::string& from,
                               const std::string& to, const GncDate& date) const
{
    if (from == to)
        return balance;

    auto when = static_cast<time64>(GncDateTime(date));
    const Price* best = nullptr;
    bool inverted = false;
    time64 best_distance = 0;
    for (const auto& price : m_prices)
    {
        auto direct = price.commodity == from && price.currency == to;
        auto inverse = price.commodity == to && price.currency == from;
        if (!direct && !inverse)
            continue;
        auto distance = price.time > when ? price.time - when : when - price.time;
        if (!best || distance < best_distance ||
            (distance == best_distance && price.time < best->time))
        {
            best = &price;
            best_distance = distance;
            inverted = inverse;
        }
    }

    if (!best)
    {
        PWARN ("No price between %s and %s", from.c_str(), to.c_str());
        return {};
    }

    auto rate = inverted ? best->value.inv() : best->value;
    auto fraction = m_commodities.at(to);
    return (balance * rate).convert<RoundType::half_up>(fraction);
}

class GncMemorySession final : public LedgerSession
{
public:
    GncMemorySession(GncMemoryBackend& backend, std::string uri, SessionMode mode,
                     std::unique_ptr<GncMemoryBook> book) :
        m_backend{backend}, m_uri{std::move(uri)}, m_mode{mode},
        m_book{std::move(book)} {}
    ~GncMemorySession() override { end(); }

    LedgerBook& get_book() override;
    const std::string& get_uri() const noexcept override { return m_uri; }
    void save() override;
    void end() override;

private:
    GncMemoryBackend& m_backend;
    std::string m_uri;
    SessionMode m_mode;
    std::unique_ptr<GncMemoryBook> m_book;
    bool m_ended = false;
};

LedgerBook&
GncMemorySession::get_book()
{
    if (m_ended)
        throw LedgerError((bl::format(bl::translate("Session for {1} has ended."))
                           % m_uri).str());
    return *m_book;
}

void
GncMemorySession::save()
{
    if (m_ended)
        throw LedgerError((bl::format(bl::translate("Session for {1} has ended."))
                           % m_uri).str());
    if (m_mode == SessionMode::read_only)
        throw LedgerError((bl::format(bl::translate("{1} was opened read-only and cannot be saved."))
                           % m_uri).str());
    m_backend.store(m_uri, *m_book);
    PINFO ("Saved %s", m_uri.c_str());
}

void
GncMemorySession::end()
{
    if (m_ended)
        return;
    m_ended = true;
    m_backend.release(m_uri, m_mode);
}

GncMemoryBook&
GncMemoryBackend::add_book(const std::string& uri, const std::string& separator)
{
    auto& book = m_books[uri];
    book = std::make_unique<GncMemoryBook>(separator);
    return *book;
}

GncMemoryBook*
GncMemoryBackend::get_book(const std::string& uri) const
{
    auto iter = m_books.find(uri);
    return iter == m_books.end() ? nullptr : iter->second.get();
}

void
GncMemoryBackend::set_writable(const std::string& uri, bool writable)
{
    if (writable)
        m_readonly.erase(uri);
    else
        m_readonly.insert(uri);
}

bool
GncMemoryBackend::is_locked(const std::string& uri) const
{
    return m_locked.find(uri) != m_locked.end();
}

void
GncMemoryBackend::copy_file(const std::string& from, const std::string& to)
{
    auto source = get_book(from);
    if (!source)
        throw LedgerError((bl::format(bl::translate("Cannot copy {1}: no such file."))
                           % from).str());
    if (from == to)
        throw LedgerError((bl::format(bl::translate("Cannot copy {1} onto itself."))
                           % from).str());
    if (m_readonly.count(to))
        throw LedgerError((bl::format(bl::translate("Cannot copy to {1}: permission denied."))
                           % to).str());
    m_books[to] = source->clone();
}

LedgerSessionPtr
GncMemoryBackend::open(const std::string& uri, SessionMode mode)
{
    auto stored = get_book(uri);
    if (!stored)
        throw LedgerError((bl::format(bl::translate("Cannot open {1}: no such file."))
                           % uri).str());
    if (mode == SessionMode::read_write)
    {
        if (m_readonly.count(uri))
            throw LedgerError((bl::format(bl::translate("{1} is read-only. Cannot open read-write."))
                               % uri).str());
        if (is_locked(uri))
            throw LedgerError((bl::format(bl::translate("{1} is locked by another session."))
                               % uri).str());
        m_locked.insert(uri);
    }
    ++m_sessions;
    PINFO ("Opened %s %s", uri.c_str(),
           mode == SessionMode::read_write ? "(r/w)" : "(readonly)");
    return std::make_unique<GncMemorySession>(*this, uri, mode, stored->clone());
}

void
GncMemoryBackend::store(const std::string& uri, const GncMemoryBook& book)
{
    if (m_readonly.count(uri))
        throw LedgerError((bl::format(bl::translate("Cannot save {1}: permission denied."))
                           % uri).str());
    m_books[uri] = book.clone();
}

void
GncMemoryBackend::release(const std::string& uri, SessionMode mode)
{
    if (mode == SessionMode::read_write)
        m_locked.erase(uri);
    --m_sessions;
}

} // namespace GncRollover
