#ifndef GMOCK_LEDGER_H
#define GMOCK_LEDGER_H

#include <gmock/gmock.h>

#include <gnc-ledger.hpp>


// mock up for LedgerAccount
class MockLedgerAccount : public GncRollover::LedgerAccount
{
public:
    MockLedgerAccount();
    ~MockLedgerAccount() override;

    MOCK_CONST_METHOD0(get_name, std::string());
    MOCK_CONST_METHOD0(get_full_name, std::string());
    MOCK_CONST_METHOD0(get_type, GNCAccountType());
    MOCK_CONST_METHOD0(get_placeholder, bool());
    MOCK_CONST_METHOD0(get_commodity, std::string());
    MOCK_CONST_METHOD0(get_balance, GncNumeric());
    MOCK_CONST_METHOD0(get_parent, GncRollover::LedgerAccount*());
    MOCK_CONST_METHOD0(get_children, GncRollover::AccountVec());
    MOCK_CONST_METHOD0(get_descendants, GncRollover::AccountVec());
    MOCK_CONST_METHOD0(get_transactions, GncRollover::TransVec());
};

// mock up for LedgerTransaction
class MockLedgerTransaction : public GncRollover::LedgerTransaction
{
public:
    MockLedgerTransaction();
    ~MockLedgerTransaction() override;

    MOCK_METHOD0(begin_edit, void());
    MOCK_METHOD0(commit_edit, void());
    MOCK_METHOD0(rollback_edit, void());
    MOCK_CONST_METHOD0(is_open, bool());
    MOCK_METHOD1(set_description, void(const std::string&));
    MOCK_CONST_METHOD0(get_description, std::string());
    MOCK_METHOD1(set_date, void(const GncDate&));
    MOCK_CONST_METHOD0(get_date, GncDate());
    MOCK_METHOD1(set_currency, void(const std::string&));
    MOCK_CONST_METHOD0(get_currency, std::string());
    MOCK_METHOD3(add_split, void(GncRollover::LedgerAccount&, GncNumeric, GncNumeric));
    MOCK_CONST_METHOD0(get_splits, GncRollover::SplitInfoVec());
};

// mock up for LedgerBook
class MockLedgerBook : public GncRollover::LedgerBook
{
public:
    MockLedgerBook();
    ~MockLedgerBook() override;

    MOCK_METHOD0(get_root_account, GncRollover::LedgerAccount*());
    MOCK_METHOD1(lookup_account, GncRollover::LedgerAccount*(const std::string&));
    MOCK_METHOD2(new_account, GncRollover::LedgerAccount*(GncRollover::LedgerAccount&,
                                                          const GncRollover::LedgerAccountSpec&));
    MOCK_METHOD0(new_transaction, GncRollover::LedgerTransaction*());
    MOCK_METHOD1(destroy_transaction, void(GncRollover::LedgerTransaction&));
    MOCK_CONST_METHOD0(get_transaction_count, std::size_t());
    MOCK_CONST_METHOD1(has_commodity, bool(const std::string&));
    MOCK_CONST_METHOD4(convert_balance, GncNumeric(GncNumeric, const std::string&,
                                                   const std::string&, const GncDate&));
    MOCK_CONST_METHOD0(get_separator, std::string());
};

// mock up for LedgerBackend
class MockLedgerBackend : public GncRollover::LedgerBackend
{
public:
    MockLedgerBackend();
    ~MockLedgerBackend() override;

    MOCK_METHOD2(copy_file, void(const std::string&, const std::string&));
    MOCK_METHOD2(open, GncRollover::LedgerSessionPtr(const std::string&,
                                                     GncRollover::SessionMode));
};

#endif
