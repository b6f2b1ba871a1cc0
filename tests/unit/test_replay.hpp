#pragma once

namespace clearcore::tests {

void test_replay_deposit_log();
void test_replay_withdrawal_log();
void test_replay_dispute_log();
void test_replay_resolve_log();
void test_replay_chargeback_log();
void test_replay_file();
void test_replay_restores_outcome_handler();

}  // namespace clearcore::tests
