#pragma once

namespace clearcore::tests {

void test_engine_deposit();
void test_engine_withdrawal();
void test_engine_insufficient_funds();
void test_engine_dispute();
void test_engine_duplicate_dispute();
void test_engine_resolve();
void test_engine_chargeback();
void test_engine_unknown_references();
void test_engine_locked_account();
void test_engine_dispute_uses_entry_owner();
void test_engine_withdrawal_not_disputable();
void test_engine_outcomes();
void test_engine_balance_invariant();
void test_engine_overflow();

}  // namespace clearcore::tests
