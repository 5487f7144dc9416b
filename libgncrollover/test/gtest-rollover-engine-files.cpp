/********************************************************************
 * gtest-rollover-engine-files.cpp -- Rollover of XML book files    *
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
#include <gnc-engine.h>
#include <gnc-commodity.h>
#include <gnc-pricedb.h>
#include <TransLog.h>
#include <Account.h>
#include <Transaction.h>

#include <boost/filesystem.hpp>

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "../gnc-ledger-engine.hpp"
#include "../gnc-rollover.hpp"

using namespace GncRollover;
namespace bfs = boost::filesystem;

static const std::string usd{"CURRENCY::USD"};
static const std::string eur{"CURRENCY::EUR"};

#define QOF_SESSION_CHECKED_CALL(_function, _session, ...) \
    do { \
        _function (_session.get (), ## __VA_ARGS__); \
        ASSERT_EQ (qof_session_get_error (_session.get ()), 0) << #_function \
            << ": " << qof_session_get_error (_session.get ()) \
            << " \"" << qof_session_get_error_message (_session.get ()) << "\""; \
    } while (0)

class GncEngineFilesTest : public ::testing::Test
{
public:
    static void SetUpTestSuite()
    {
        xaccLogDisable();
        gnc_engine_init(0, nullptr);
    }

    static void TearDownTestSuite()
    {
        gnc_engine_shutdown();
    }

protected:
    GncEngineFilesTest()
    {
        auto dir = g_dir_make_tmp("gnc-rollover-XXXXXX", nullptr);
        if (dir)
        {
            m_dir = dir;
            g_free(dir);
        }
    }

    ~GncEngineFilesTest()
    {
        boost::system::error_code ec;
        if (!m_dir.empty())
            bfs::remove_all(m_dir, ec);
    }

    std::string path(const std::string& name) const
    {
        return (m_dir / name).string();
    }

    std::string uri(const std::string& name) const
    {
        return "xml://" + path(name);
    }

    bool exists(const std::string& name) const
    {
        return bfs::exists(m_dir / name);
    }

    /* Checking 1000.00 and CreditCard -200.00 against Income, Euro Account
     * 100.00 EUR against Foreign Income if @a euro is set. */
    void write_previous_book(const std::string& name, bool euro, bool price)
    {
        auto session = std::shared_ptr<QofSession>{qof_session_new(qof_book_new()),
                                                   qof_session_destroy};
        QOF_SESSION_CHECKED_CALL(qof_session_begin, session, uri(name).c_str(),
                                 SESSION_NEW_STORE);
        auto qof_book = qof_session_get_book(session.get());
        {
            GncEngineBook book{qof_book};
            auto root = book.get_root_account();
            auto asset = book.new_account(*root, {"Asset", ACCT_TYPE_ASSET, usd, true, false});
            auto checking = book.new_account(*asset, {"Checking", ACCT_TYPE_BANK, usd, false, false});
            auto liability = book.new_account(*root, {"Liability", ACCT_TYPE_LIABILITY, usd, true, false});
            auto card = book.new_account(*liability, {"CreditCard", ACCT_TYPE_CREDIT, usd, false, false});
            auto income = book.new_account(*root, {"Income", ACCT_TYPE_INCOME, usd, false, false});
            post(book, *checking, *income, usd, GncNumeric(100000, 100));
            post(book, *card, *income, usd, GncNumeric(-20000, 100));
            if (euro)
            {
                auto foreign = book.new_account(*asset, {"Euro Account", ACCT_TYPE_BANK, eur, false, false});
                auto foreign_income = book.new_account(*root, {"Foreign Income", ACCT_TYPE_INCOME, eur, false, false});
                post(book, *foreign, *foreign_income, eur, GncNumeric(10000, 100));
            }
            if (price)
                add_price(book, eur, usd, GncDate(2024, 12, 31), GncNumeric(110, 100));
        }
        QOF_SESSION_CHECKED_CALL(qof_session_save, session, nullptr);
        qof_session_end(session.get());
    }

    RolloverParams params(const std::string& previous, const std::string& next) const
    {
        RolloverParams rv;
        rv.previous_file = uri(previous);
        rv.new_file = uri(next);
        rv.opening_date = GncDate(2025, 1, 1);
        return rv;
    }

    GncEngineBackend m_backend;
    bfs::path m_dir;

private:
    static void post(GncEngineBook& book, LedgerAccount& acct, LedgerAccount& other,
                     const std::string& currency, GncNumeric amount)
    {
        auto trans = book.new_transaction();
        TransactionEdit edit{*trans};
        trans->set_currency(currency);
        trans->set_description("Transfer");
        trans->set_date(GncDate(2024, 6, 1));
        trans->add_split(acct, amount, amount);
        trans->add_split(other, -amount, -amount);
        edit.commit();
    }

    static void add_price(GncEngineBook& book, const std::string& from,
                          const std::string& to, const GncDate& date,
                          GncNumeric value)
    {
        auto price = gnc_price_create(book.gobj());
        gnc_price_begin_edit(price);
        gnc_price_set_commodity(price, book.lookup_commodity(from));
        gnc_price_set_currency(price, book.lookup_commodity(to));
        gnc_price_set_time64(price, static_cast<time64>(GncDateTime(date)));
        gnc_price_set_source(price, PRICE_SOURCE_USER_PRICE);
        gnc_price_set_typestr(price, PRICE_TYPE_LAST);
        gnc_price_set_value(price, value);
        gnc_price_commit_edit(price);
        gnc_pricedb_add_price(gnc_pricedb_get_db(book.gobj()), price);
        gnc_price_unref(price);
    }
};

TEST_F(GncEngineFilesTest, run_writes_opening_balances)
{
    ASSERT_FALSE(m_dir.empty());
    ASSERT_NO_FATAL_FAILURE(write_previous_book("2024.gnucash", false, false));

    Rollover rollover{m_backend, params("2024.gnucash", "2025.gnucash")};
    auto& summary = rollover.run();
    EXPECT_EQ(2u, summary.deleted);
    EXPECT_EQ(2u, summary.created_accounts);
    EXPECT_EQ(2u, summary.created_transactions);
    EXPECT_FALSE(exists("2025.gnucash.LCK"));

    auto session = m_backend.open(uri("2025.gnucash"), SessionMode::read_only);
    auto& book = session->get_book();
    EXPECT_EQ(2u, book.get_transaction_count());
    ASSERT_NE(nullptr, book.lookup_account("Asset:Checking"));
    EXPECT_EQ(GncNumeric(100000, 100), book.lookup_account("Asset:Checking")->get_balance());
    EXPECT_EQ(GncNumeric(-20000, 100), book.lookup_account("Liability:CreditCard")->get_balance());
    EXPECT_EQ(0, book.lookup_account("Income")->get_balance().num());

    auto equity = book.lookup_account("Equity");
    ASSERT_NE(nullptr, equity);
    EXPECT_TRUE(equity->get_placeholder());
    auto opening = book.lookup_account("Equity:Opening balance");
    ASSERT_NE(nullptr, opening);
    EXPECT_EQ(ACCT_TYPE_EQUITY, opening->get_type());
    EXPECT_EQ(GncNumeric(-80000, 100), opening->get_balance());
    for (auto trans : opening->get_transactions())
    {
        EXPECT_EQ(GncDate(2025, 1, 1), trans->get_date());
        EXPECT_EQ("Opening balance", trans->get_description());
    }
    session->end();

    /* The previous year's file is untouched. */
    auto previous = m_backend.open(uri("2024.gnucash"), SessionMode::read_only);
    EXPECT_EQ(2u, previous->get_book().get_transaction_count());
    EXPECT_EQ(nullptr, previous->get_book().lookup_account("Equity"));
}

TEST_F(GncEngineFilesTest, run_converts_foreign_balance)
{
    ASSERT_FALSE(m_dir.empty());
    ASSERT_NO_FATAL_FAILURE(write_previous_book("2024.gnucash", true, true));

    Rollover rollover{m_backend, params("2024.gnucash", "2025.gnucash")};
    EXPECT_EQ(3u, rollover.run().created_transactions);

    auto session = m_backend.open(uri("2025.gnucash"), SessionMode::read_only);
    auto& book = session->get_book();
    EXPECT_EQ(3u, book.get_transaction_count());
    EXPECT_EQ(GncNumeric(-91000, 100),
              book.lookup_account("Equity:Opening balance")->get_balance());

    auto foreign = book.lookup_account("Asset:Euro Account");
    ASSERT_NE(nullptr, foreign);
    EXPECT_EQ(GncNumeric(10000, 100), foreign->get_balance());
    auto transactions = foreign->get_transactions();
    ASSERT_EQ(1u, transactions.size());
    EXPECT_EQ(usd, transactions[0]->get_currency());
    auto found = false;
    for (const auto& split : transactions[0]->get_splits())
    {
        if (split.account != foreign)
            continue;
        found = true;
        EXPECT_EQ(GncNumeric(10000, 100), split.amount);
        EXPECT_EQ(GncNumeric(11000, 100), split.value);
    }
    EXPECT_TRUE(found);
}

TEST_F(GncEngineFilesTest, failed_run_leaves_copy_unsaved)
{
    ASSERT_FALSE(m_dir.empty());
    ASSERT_NO_FATAL_FAILURE(write_previous_book("2024.gnucash", true, false));

    Rollover rollover{m_backend, params("2024.gnucash", "2025.gnucash")};
    EXPECT_THROW(rollover.run(), LedgerError);
    EXPECT_FALSE(exists("2025.gnucash.LCK"));

    /* The XML backend only writes on save, so the copy is unchanged. */
    auto session = m_backend.open(uri("2025.gnucash"), SessionMode::read_write);
    EXPECT_EQ(3u, session->get_book().get_transaction_count());
    EXPECT_EQ(nullptr, session->get_book().lookup_account("Equity"));
}

TEST_F(GncEngineFilesTest, copy_file)
{
    ASSERT_FALSE(m_dir.empty());
    ASSERT_NO_FATAL_FAILURE(write_previous_book("2024.gnucash", false, false));

    m_backend.copy_file(uri("2024.gnucash"), uri("copy.gnucash"));
    EXPECT_TRUE(exists("copy.gnucash"));
    m_backend.copy_file(path("2024.gnucash"), path("plain.gnucash"));
    EXPECT_TRUE(exists("plain.gnucash"));
    m_backend.copy_file(path("2024.gnucash"), "file://" + path("file-uri.gnucash"));
    EXPECT_TRUE(exists("file-uri.gnucash"));

    EXPECT_THROW(m_backend.copy_file(uri("2024.gnucash"), uri("2024.gnucash")), LedgerError);
    EXPECT_THROW(m_backend.copy_file(uri("missing.gnucash"), uri("other.gnucash")), LedgerError);
    EXPECT_FALSE(exists("other.gnucash"));
    EXPECT_THROW(m_backend.copy_file(uri("2024.gnucash"), "postgres://localhost/books"),
                 LedgerError);
    EXPECT_THROW(m_backend.copy_file("postgres://localhost/books", uri("other.gnucash")),
                 LedgerError);
}

TEST_F(GncEngineFilesTest, copy_into_missing_directory)
{
    ASSERT_FALSE(m_dir.empty());
    ASSERT_NO_FATAL_FAILURE(write_previous_book("2024.gnucash", false, false));

    Rollover rollover{m_backend, params("2024.gnucash", "missing/2025.gnucash")};
    EXPECT_THROW(rollover.run(), LedgerError);
    EXPECT_FALSE(exists("missing/2025.gnucash"));
    EXPECT_FALSE(exists("missing/2025.gnucash.LCK"));
    EXPECT_FALSE(exists("missing"));
}

TEST_F(GncEngineFilesTest, open_missing_file)
{
    ASSERT_FALSE(m_dir.empty());
    EXPECT_THROW(m_backend.open(uri("missing.gnucash"), SessionMode::read_write), LedgerError);
    EXPECT_THROW(m_backend.open(uri("missing.gnucash"), SessionMode::read_only), LedgerError);
}

TEST_F(GncEngineFilesTest, session_lock)
{
    ASSERT_FALSE(m_dir.empty());
    ASSERT_NO_FATAL_FAILURE(write_previous_book("2024.gnucash", false, false));

    auto session = m_backend.open(uri("2024.gnucash"), SessionMode::read_write);
    EXPECT_TRUE(exists("2024.gnucash.LCK"));
    EXPECT_THROW(m_backend.open(uri("2024.gnucash"), SessionMode::read_write), LedgerError);

    /* A read-only session neither needs nor takes the lock. */
    auto reader = m_backend.open(uri("2024.gnucash"), SessionMode::read_only);
    EXPECT_EQ(2u, reader->get_book().get_transaction_count());
    EXPECT_THROW(reader->save(), LedgerError);

    session->end();
    EXPECT_FALSE(exists("2024.gnucash.LCK"));
    EXPECT_THROW(session->get_book(), LedgerError);
    auto again = m_backend.open(uri("2024.gnucash"), SessionMode::read_write);
    EXPECT_EQ(2u, again->get_book().get_transaction_count());
}
