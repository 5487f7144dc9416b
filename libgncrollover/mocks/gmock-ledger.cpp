#include <config.h>

#include "gmock-ledger.h"


MockLedgerAccount::MockLedgerAccount() = default;
MockLedgerAccount::~MockLedgerAccount() = default;

MockLedgerTransaction::MockLedgerTransaction() = default;
MockLedgerTransaction::~MockLedgerTransaction() = default;

MockLedgerBook::MockLedgerBook() = default;
MockLedgerBook::~MockLedgerBook() = default;

MockLedgerBackend::MockLedgerBackend() = default;
MockLedgerBackend::~MockLedgerBackend() = default;
