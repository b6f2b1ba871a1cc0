#pragma once

namespace clearcore::tests {

void test_account_store();
void test_transaction_ledger();

}  // namespace clearcore::tests
