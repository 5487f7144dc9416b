/********************************************************************
 * gtest-rollover-engine.cpp -- Rollover steps on an engine book    *
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
#include <qof.h>
#include <cashobjects.h>
#include <gnc-commodity.h>
#include <gnc-pricedb.h>
#include <Account.h>
#include <Transaction.h>

#include <gtest/gtest.h>

#include "../gnc-ledger-engine.hpp"
#include "../gnc-rollover.hpp"

using namespace GncRollover;

static const std::string usd{"CURRENCY::USD"};
static const std::string eur{"CURRENCY::EUR"};

class GncEngineRolloverTest : public ::testing::Test
{
public:
    static void SetUpTestSuite()
    {
        qof_init();
        cashobjects_register();
    }

    static void TearDownTestSuite()
    {
        qof_close();
    }

protected:
    GncEngineRolloverTest() : m_qof_book{qof_book_new()}, m_book{m_qof_book}
    {
        auto root = m_book.get_root_account();
        auto asset = m_book.new_account(*root, {"Asset", ACCT_TYPE_ASSET, usd, true, false});
        m_checking = m_book.new_account(*asset, {"Checking", ACCT_TYPE_BANK, usd, false, false});
        m_foreign = m_book.new_account(*asset, {"Euro Account", ACCT_TYPE_BANK, eur, false, false});
        auto liability = m_book.new_account(*root, {"Liability", ACCT_TYPE_LIABILITY, usd, true, false});
        m_card = m_book.new_account(*liability, {"CreditCard", ACCT_TYPE_CREDIT, usd, false, false});
        m_income = m_book.new_account(*root, {"Income", ACCT_TYPE_INCOME, usd, false, false});
    }

    ~GncEngineRolloverTest()
    {
        qof_book_destroy(m_qof_book);
    }

    LedgerTransaction* post(LedgerAccount& acct, LedgerAccount& other, GncNumeric amount)
    {
        auto trans = m_book.new_transaction();
        TransactionEdit edit{*trans};
        trans->set_currency(usd);
        trans->set_description("Transfer");
        trans->set_date(GncDate(2024, 6, 1));
        trans->add_split(acct, amount, amount);
        trans->add_split(other, -amount, -amount);
        edit.commit();
        return trans;
    }

    void add_price(const std::string& from, const std::string& to,
                   const GncDate& date, GncNumeric value)
    {
        auto price = gnc_price_create(m_qof_book);
        gnc_price_begin_edit(price);
        gnc_price_set_commodity(price, m_book.lookup_commodity(from));
        gnc_price_set_currency(price, m_book.lookup_commodity(to));
        gnc_price_set_time64(price, static_cast<time64>(GncDateTime(date)));
        gnc_price_set_source(price, PRICE_SOURCE_USER_PRICE);
        gnc_price_set_typestr(price, PRICE_TYPE_LAST);
        gnc_price_set_value(price, value);
        gnc_price_commit_edit(price);
        gnc_pricedb_add_price(gnc_pricedb_get_db(m_qof_book), price);
        gnc_price_unref(price);
    }

    QofBook* m_qof_book;
    GncEngineBook m_book;
    LedgerAccount* m_checking;
    LedgerAccount* m_foreign;
    LedgerAccount* m_card;
    LedgerAccount* m_income;
};

TEST_F(GncEngineRolloverTest, account_tree)
{
    EXPECT_EQ(":", m_book.get_separator());
    EXPECT_EQ(m_checking, m_book.lookup_account("Asset:Checking"));
    EXPECT_EQ(nullptr, m_book.lookup_account("Asset:Savings"));
    EXPECT_EQ("Liability:CreditCard", m_card->get_full_name());
    EXPECT_EQ(ACCT_TYPE_CREDIT, m_card->get_type());
    EXPECT_EQ(eur, m_foreign->get_commodity());
    EXPECT_TRUE(m_checking->get_parent()->get_placeholder());
    EXPECT_EQ(6u, m_book.get_root_account()->get_descendants().size());
    EXPECT_EQ(3u, m_book.get_root_account()->get_children().size());
    EXPECT_TRUE(m_book.has_commodity(usd));
    EXPECT_FALSE(m_book.has_commodity("CURRENCY::XYZ"));
}

TEST_F(GncEngineRolloverTest, transactions)
{
    auto trans = post(*m_checking, *m_income, GncNumeric(50000, 100));
    post(*m_card, *m_income, GncNumeric(-12345, 100));
    EXPECT_EQ(2u, m_book.get_transaction_count());
    EXPECT_EQ(GncNumeric(50000, 100), m_checking->get_balance());
    EXPECT_EQ(GncNumeric(-12345, 100), m_card->get_balance());
    EXPECT_EQ("Transfer", trans->get_description());
    EXPECT_EQ(usd, trans->get_currency());
    EXPECT_EQ(GncDate(2024, 6, 1), trans->get_date());
    ASSERT_EQ(2u, trans->get_splits().size());
    EXPECT_EQ(m_checking, trans->get_splits()[0].account);

    auto transactions = m_income->get_transactions();
    EXPECT_EQ(2u, transactions.size());
}

TEST_F(GncEngineRolloverTest, rollback_new_transaction)
{
    auto trans = m_book.new_transaction();
    {
        TransactionEdit edit{*trans};
        trans->set_currency(usd);
        trans->add_split(*m_checking, GncNumeric(100, 1), GncNumeric(100, 1));
    }
    EXPECT_EQ(0u, m_book.get_transaction_count());
    EXPECT_TRUE(m_checking->get_transactions().empty());
    EXPECT_EQ(0, m_checking->get_balance().num());
}

TEST_F(GncEngineRolloverTest, count_skips_uncommitted_transaction)
{
    post(*m_checking, *m_income, GncNumeric(50000, 100));
    auto trans = m_book.new_transaction();
    TransactionEdit edit{*trans};
    trans->set_currency(usd);
    trans->set_date(GncDate(2024, 6, 2));
    trans->add_split(*m_checking, GncNumeric(100, 1), GncNumeric(100, 1));
    trans->add_split(*m_income, GncNumeric(-100, 1), GncNumeric(-100, 1));
    EXPECT_EQ(1u, m_book.get_transaction_count());
    edit.commit();
    EXPECT_EQ(2u, m_book.get_transaction_count());
}

TEST_F(GncEngineRolloverTest, delete_all_transactions)
{
    post(*m_checking, *m_income, GncNumeric(50000, 100));
    post(*m_card, *m_income, GncNumeric(-12345, 100));
    EXPECT_EQ(2u, delete_all_transactions(m_book));
    EXPECT_EQ(0u, m_book.get_transaction_count());
    EXPECT_EQ(0, m_checking->get_balance().num());
    EXPECT_EQ(m_checking, m_book.lookup_account("Asset:Checking"));
}

TEST_F(GncEngineRolloverTest, get_account_balances)
{
    post(*m_checking, *m_income, GncNumeric(50000, 100));
    post(*m_card, *m_income, GncNumeric(-12345, 100));
    auto balances = get_account_balances(m_book);
    ASSERT_EQ(3u, balances.size());
    EXPECT_EQ(GncNumeric(50000, 100), balances.at("Asset:Checking").balance);
    EXPECT_EQ(GncNumeric(-12345, 100), balances.at("Liability:CreditCard").balance);
    EXPECT_EQ(0, balances.at("Asset:Euro Account").balance.num());
    EXPECT_EQ(0u, balances.count("Income"));
}

TEST_F(GncEngineRolloverTest, ensure_equity_accounts)
{
    auto equity = ensure_equity_accounts(m_book, "Equity", "Opening balance", "USD");
    EXPECT_EQ(2u, equity.created);
    auto opening = dynamic_cast<GncEngineAccount*>(equity.opening);
    ASSERT_NE(nullptr, opening);
    EXPECT_TRUE(xaccAccountGetIsOpeningBalance(opening->gobj()));
    EXPECT_TRUE(equity.placeholder->get_placeholder());
    EXPECT_EQ(ACCT_TYPE_EQUITY, equity.opening->get_type());
    EXPECT_EQ("Equity:Opening balance", equity.opening->get_full_name());

    auto again = ensure_equity_accounts(m_book, "Equity", "Opening balance", "USD");
    EXPECT_EQ(0u, again.created);
    EXPECT_EQ(equity.opening, again.opening);
}

TEST_F(GncEngineRolloverTest, convert_balance)
{
    add_price(eur, usd, GncDate(2024, 12, 1), GncNumeric(105, 100));
    add_price(eur, usd, GncDate(2024, 12, 31), GncNumeric(110, 100));
    EXPECT_EQ(GncNumeric(11000, 100),
              m_book.convert_balance(GncNumeric(10000, 100), eur, usd, GncDate(2025, 1, 1)));
    EXPECT_EQ(GncNumeric(10000, 100),
              m_book.convert_balance(GncNumeric(10000, 100), usd, usd, GncDate(2025, 1, 1)));
    EXPECT_THROW(m_book.convert_balance(GncNumeric(1, 1), "CURRENCY::XYZ", usd,
                                        GncDate(2025, 1, 1)),
                 LedgerError);
}

TEST_F(GncEngineRolloverTest, opening_transactions)
{
    post(*m_checking, *m_income, GncNumeric(50000, 100));
    post(*m_card, *m_income, GncNumeric(-12345, 100));
    auto balances = get_account_balances(m_book);
    delete_all_transactions(m_book);

    auto equity = ensure_equity_accounts(m_book, "Equity", "Opening balance", "USD");
    auto created = create_opening_transactions(m_book, balances, *equity.opening,
                                               "Opening balance", GncDate(2025, 1, 1));
    ASSERT_EQ(2u, created.size());
    EXPECT_EQ(2u, m_book.get_transaction_count());
    EXPECT_EQ(GncNumeric(50000, 100), m_checking->get_balance());
    EXPECT_EQ(GncNumeric(-12345, 100), m_card->get_balance());
    EXPECT_EQ(GncNumeric(-37655, 100), equity.opening->get_balance());

    for (auto trans : created)
    {
        auto gtrans = dynamic_cast<GncEngineTransaction*>(trans)->gobj();
        EXPECT_TRUE(xaccTransIsBalanced(gtrans));
        EXPECT_FALSE(xaccTransIsOpen(gtrans));
        EXPECT_EQ(GncDate(2025, 1, 1), trans->get_date());
        EXPECT_EQ("Opening balance", trans->get_description());
    }
}
