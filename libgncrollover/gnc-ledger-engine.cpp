/********************************************************************
 * gnc-ledger-engine.cpp -- Ledger backend on the GnuCash engine    *
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

#include <glib.h>
#include <qof.h>
#include <qoflog.h>
#include <gnc-engine.h>
#include <gnc-commodity.h>
#include <gnc-features.h>
#include <gnc-pricedb.h>
#include <gnc-uri-utils.h>
#include <Account.h>
#include <Split.h>
#include <Transaction.h>

#include <boost/filesystem.hpp>
#include <boost/locale.hpp>

#include "gnc-ledger-engine.hpp"

static const QofLogModule log_module = "gnc.rollover.engine";

namespace bl = boost::locale;
namespace bfs = boost::filesystem;

namespace GncRollover {

static AccountVec
accounts_from_glist(GncEngineBook& book, GList* list)
{
    AccountVec accounts;
    for (auto node = list; node; node = g_list_next(node))
        accounts.push_back(book.wrap(static_cast<::Account*>(node->data)));
    g_list_free(list);
    return accounts;
}

static void
report_session_percentage (const char *message, double percent)
{
    static double previous = 0.0;
    if ((percent - previous) < 5.0)
        return;
    PINFO ("\r%3.0f%% complete...", percent);
    previous = percent;
}

std::string
GncEngineAccount::get_name() const
{
    auto name = xaccAccountGetName(m_acct);
    return name ? name : "";
}

std::string
GncEngineAccount::get_full_name() const
{
    auto name = gnc_account_get_full_name(m_acct);
    std::string rv{name ? name : ""};
    g_free(name);
    return rv;
}

GNCAccountType
GncEngineAccount::get_type() const
{
    return xaccAccountGetType(m_acct);
}

bool
GncEngineAccount::get_placeholder() const
{
    return xaccAccountGetPlaceholder(m_acct);
}

std::string
GncEngineAccount::get_commodity() const
{
    auto comm = xaccAccountGetCommodity(m_acct);
    return comm ? gnc_commodity_get_unique_name(comm) : "";
}

GncNumeric
GncEngineAccount::get_balance() const
{
    return xaccAccountGetBalance(m_acct);
}

LedgerAccount*
GncEngineAccount::get_parent() const
{
    return m_book.wrap(gnc_account_get_parent(m_acct));
}

AccountVec
GncEngineAccount::get_children() const
{
    return accounts_from_glist(m_book, gnc_account_get_children(m_acct));
}

AccountVec
GncEngineAccount::get_descendants() const
{
    return accounts_from_glist(m_book, gnc_account_get_descendants(m_acct));
}

static gint
collect_transaction(::Transaction* trans, void* data)
{
    static_cast<std::vector<::Transaction*>*>(data)->push_back(trans);
    return 0;
}

TransVec
GncEngineAccount::get_transactions() const
{
    std::vector<::Transaction*> found;
    xaccAccountForEachTransaction(m_acct, collect_transaction, &found);
    TransVec transactions;
    for (auto trans : found)
        transactions.push_back(m_book.wrap(trans));
    return transactions;
}

void
GncEngineTransaction::begin_edit()
{
    xaccTransBeginEdit(m_trans);
}

void
GncEngineTransaction::commit_edit()
{
    xaccTransCommitEdit(m_trans);
    if (!xaccTransIsOpen(m_trans))
        m_committed = true;
}

void
GncEngineTransaction::rollback_edit()
{
    if (m_committed)
    {
        xaccTransRollbackEdit(m_trans);
        return;
    }
    /* The engine has nothing to roll a new transaction back to, so it is
     * destroyed instead. forget() deletes *this. */
    auto trans = m_trans;
    auto& book = m_book;
    xaccTransDestroy(trans);
    xaccTransCommitEdit(trans);
    book.forget(trans);
}

bool
GncEngineTransaction::is_open() const
{
    return xaccTransIsOpen(m_trans);
}

void
GncEngineTransaction::set_description(const std::string& description)
{
    xaccTransSetDescription(m_trans, description.c_str());
}

std::string
GncEngineTransaction::get_description() const
{
    auto desc = xaccTransGetDescription(m_trans);
    return desc ? desc : "";
}

void
GncEngineTransaction::set_date(const GncDate& date)
{
    auto ymd = date.year_month_day();
    xaccTransSetDate(m_trans, ymd.day, ymd.month, ymd.year);
}

GncDate
GncEngineTransaction::get_date() const
{
    return GncDateTime(xaccTransGetDate(m_trans)).date();
}

void
GncEngineTransaction::set_currency(const std::string& currency)
{
    auto comm = m_book.lookup_commodity(currency);
    if (!comm)
        throw LedgerError((bl::format(bl::translate("Unknown transaction currency {1}."))
                           % currency).str());
    xaccTransSetCurrency(m_trans, comm);
}

std::string
GncEngineTransaction::get_currency() const
{
    auto comm = xaccTransGetCurrency(m_trans);
    return comm ? gnc_commodity_get_unique_name(comm) : "";
}

void
GncEngineTransaction::add_split(LedgerAccount& account, GncNumeric amount,
                                GncNumeric value)
{
    auto acct = m_book.unwrap(account);
    auto split = xaccMallocSplit(m_book.gobj());
    xaccSplitSetParent(split, m_trans);
    xaccSplitSetAccount(split, acct);
    xaccSplitSetAmount(split, amount);
    xaccSplitSetValue(split, value);
}

SplitInfoVec
GncEngineTransaction::get_splits() const
{
    SplitInfoVec splits;
    for (auto node = xaccTransGetSplitList(m_trans); node; node = g_list_next(node))
    {
        auto split = static_cast<::Split*>(node->data);
        splits.push_back({m_book.wrap(xaccSplitGetAccount(split)),
                          xaccSplitGetAmount(split), xaccSplitGetValue(split)});
    }
    return splits;
}

GncEngineAccount*
GncEngineBook::wrap(::Account* acct)
{
    if (!acct)
        return nullptr;
    auto& wrapper = m_accounts[acct];
    if (!wrapper)
        wrapper = std::make_unique<GncEngineAccount>(*this, acct);
    return wrapper.get();
}

GncEngineTransaction*
GncEngineBook::wrap(::Transaction* trans)
{
    if (!trans)
        return nullptr;
    auto& wrapper = m_transactions[trans];
    if (!wrapper)
        wrapper = std::make_unique<GncEngineTransaction>(*this, trans);
    return wrapper.get();
}

void
GncEngineBook::forget(const ::Transaction* trans)
{
    m_transactions.erase(trans);
}

gnc_commodity*
GncEngineBook::lookup_commodity(const std::string& commodity) const
{
    if (commodity.empty())
        return nullptr;
    auto table = gnc_commodity_table_get_table(m_book);
    return gnc_commodity_table_lookup_unique(table, commodity.c_str());
}

::Account*
GncEngineBook::unwrap(LedgerAccount& account) const
{
    auto acct = dynamic_cast<GncEngineAccount*>(&account);
    if (!acct || gnc_account_get_book(acct->gobj()) != m_book)
        throw LedgerError((bl::format(bl::translate("Account {1} does not belong to this book."))
                           % account.get_full_name()).str());
    return acct->gobj();
}

LedgerAccount*
GncEngineBook::get_root_account()
{
    return wrap(gnc_book_get_root_account(m_book));
}

LedgerAccount*
GncEngineBook::lookup_account(const std::string& full_name)
{
    auto root = gnc_book_get_root_account(m_book);
    return wrap(gnc_account_lookup_by_full_name(root, full_name.c_str()));
}

LedgerAccount*
GncEngineBook::new_account(LedgerAccount& parent, const LedgerAccountSpec& spec)
{
    auto parent_acct = unwrap(parent);
    gnc_commodity* comm = nullptr;
    if (!spec.commodity.empty())
    {
        comm = lookup_commodity(spec.commodity);
        if (!comm)
            throw LedgerError((bl::format(bl::translate("Unknown commodity {1}."))
                               % spec.commodity).str());
    }

    auto acct = xaccMallocAccount(m_book);
    xaccAccountBeginEdit(acct);
    xaccAccountSetName(acct, spec.name.c_str());
    xaccAccountSetType(acct, spec.type);
    xaccAccountSetPlaceholder(acct, spec.placeholder);
    if (comm)
        xaccAccountSetCommodity(acct, comm);
    if (spec.opening_balance)
    {
        xaccAccountSetIsOpeningBalance(acct, TRUE);
        gnc_features_set_used(m_book, GNC_FEATURE_EQUITY_TYPE_OPENING_BALANCE);
    }
    gnc_account_append_child(parent_acct, acct);
    xaccAccountCommitEdit(acct);
    return wrap(acct);
}

LedgerTransaction*
GncEngineBook::new_transaction()
{
    auto trans = xaccMallocTransaction(m_book);
    auto& wrapper = m_transactions[trans];
    wrapper = std::make_unique<GncEngineTransaction>(*this, trans, false);
    return wrapper.get();
}

void
GncEngineBook::destroy_transaction(LedgerTransaction& trans)
{
    auto wrapper = dynamic_cast<GncEngineTransaction*>(&trans);
    if (!wrapper)
        throw LedgerError(bl::translate("Transaction does not belong to this book."));
    auto gtrans = wrapper->gobj();

    /* xaccTransDestroy silently ignores read-only transactions. */
    if (xaccTransGetReadOnly(gtrans))
    {
        DEBUG ("clearing read-only reason \"%s\"", xaccTransGetReadOnly(gtrans));
        xaccTransClearReadOnly(gtrans);
    }
    xaccTransBeginEdit(gtrans);
    xaccTransDestroy(gtrans);
    xaccTransCommitEdit(gtrans);
    forget(gtrans);
}

static void
count_committed(QofInstance* inst, gpointer data)
{
    /* An infant has never been committed. */
    if (!qof_instance_get_infant(inst))
        ++*static_cast<std::size_t*>(data);
}

std::size_t
GncEngineBook::get_transaction_count() const
{
    std::size_t count = 0;
    qof_collection_foreach(qof_book_get_collection(m_book, GNC_ID_TRANS),
                           count_committed, &count);
    return count;
}

bool
GncEngineBook::has_commodity(const std::string& commodity) const
{
    return lookup_commodity(commodity) != nullptr;
}

GncNumeric
GncEngineBook::convert_balance(GncNumeric balance, const std::string& from,
                               const std::string& to, const GncDate& date) const
{
    auto from_comm = lookup_commodity(from);
    auto to_comm = lookup_commodity(to);
    if (!from_comm || !to_comm)
        throw LedgerError((bl::format(bl::translate("Cannot convert from {1} to {2}: unknown commodity."))
                           % from % to).str());
    if (gnc_commodity_equiv(from_comm, to_comm))
        return balance;

    auto pricedb = gnc_pricedb_get_db(m_book);
    auto when = static_cast<time64>(GncDateTime(date));
    return gnc_pricedb_convert_balance_nearest_price_t64(pricedb, balance,
                                                         from_comm, to_comm,
                                                         when);
}

std::string
GncEngineBook::get_separator() const
{
    return gnc_get_account_separator_string();
}

GncEngineSession::GncEngineSession(QofSession* session, std::string uri) :
    m_session{session}, m_uri{std::move(uri)},
    m_book{std::make_unique<GncEngineBook>(qof_session_get_book(session))}
{
}

GncEngineSession::~GncEngineSession()
{
    end();
    m_book.reset();
    qof_session_destroy(m_session);
}

LedgerBook&
GncEngineSession::get_book()
{
    if (!m_book)
        throw LedgerError((bl::format(bl::translate("Session for {1} has ended."))
                           % m_uri).str());
    return *m_book;
}

void
GncEngineSession::save()
{
    if (qof_book_is_readonly(qof_session_get_book(m_session)))
        throw LedgerError((bl::format(bl::translate("{1} was opened read-only and cannot be saved."))
                           % m_uri).str());

    qof_session_save(m_session, report_session_percentage);
    auto io_err = qof_session_get_error(m_session);
    if (io_err != ERR_BACKEND_NO_ERR)
        throw LedgerError((bl::format(bl::translate("Saving {1} failed (error {2}): {3}"))
                           % m_uri % static_cast<int>(io_err)
                           % qof_session_get_error_message(m_session)).str());
}

void
GncEngineSession::end()
{
    if (!m_book)
        return;
    PINFO ("Closing %s", m_uri.c_str());
    qof_session_end(m_session);
    m_book.reset();
}

void
GncEngineBackend::copy_file(const std::string& from, const std::string& to)
{
    if (!gnc_uri_targets_local_fs(from.c_str()) || !gnc_uri_targets_local_fs(to.c_str()))
        throw LedgerError((bl::format(bl::translate("Cannot copy {1} to {2}: only file based books can be copied."))
                           % from % to).str());

    auto uri_path = [](const std::string& uri)
    {
        auto path = gnc_uri_get_path(uri.c_str());
        bfs::path rv{path ? path : ""};
        g_free(path);
        return rv;
    };
    auto from_path = uri_path(from);
    auto to_path = uri_path(to);

    try
    {
        if (bfs::exists(to_path) && bfs::equivalent(from_path, to_path))
            throw LedgerError((bl::format(bl::translate("Cannot copy {1} onto itself."))
                               % from_path.string()).str());
        bfs::copy_file(from_path, to_path, bfs::copy_options::overwrite_existing);
    }
    catch (const bfs::filesystem_error& err)
    {
        throw LedgerError((bl::format(bl::translate("Cannot copy {1} to {2}: {3}"))
                           % from_path.string() % to_path.string()
                           % err.code().message()).str());
    }
    PINFO ("Copied %s to %s", from_path.c_str(), to_path.c_str());
}

LedgerSessionPtr
GncEngineBackend::open(const std::string& uri, SessionMode mode)
{
    auto read_write = mode == SessionMode::read_write;
    PINFO ("Loading %s %s", uri.c_str(), read_write ? "(r/w)" : "(readonly)");

    auto session = qof_session_new(qof_book_new());
    qof_session_begin(session, uri.c_str(),
                      read_write ? SESSION_NORMAL_OPEN : SESSION_READ_ONLY);
    auto io_err = qof_session_get_error(session);
    if (io_err == ERR_BACKEND_NO_ERR)
    {
        qof_session_load(session, report_session_percentage);
        io_err = qof_session_get_error(session);
    }

    if (io_err != ERR_BACKEND_NO_ERR)
    {
        std::string err;
        switch (io_err)
        {
        case ERR_BACKEND_LOCKED:
            err = (bl::format(bl::translate("File {1} is locked, won't open.")) % uri).str();
            break;
        case ERR_BACKEND_READONLY:
            err = (bl::format(bl::translate("File {1} is readonly. Cannot open read-write.")) % uri).str();
            break;
        default:
            err = (bl::format(bl::translate("Cannot open {1} (error {2}): {3}"))
                   % uri % static_cast<int>(io_err)
                   % qof_session_get_error_message(session)).str();
            break;
        }
        PERR ("Session Error: %s", err.c_str());
        qof_session_destroy(session);
        throw LedgerError(err);
    }

    if (!read_write)
        qof_book_mark_readonly(qof_session_get_book(session));
    return std::make_unique<GncEngineSession>(session, uri);
}

} // namespace GncRollover
