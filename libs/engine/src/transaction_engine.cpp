#include "clearcore/engine/transaction_engine.hpp"

#include <utility>
#include <variant>

namespace clearcore {
namespace engine {

std::string_view to_string(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kAccountLocked:
      return "account_locked";
    case Outcome::kInsufficientFunds:
      return "insufficient_funds";
    case Outcome::kUnknownTransaction:
      return "unknown_transaction";
    case Outcome::kAlreadyDisputed:
      return "already_disputed";
    case Outcome::kNotDisputed:
      return "not_disputed";
    case Outcome::kBalanceOverflow:
      return "balance_overflow";
  }
  return "unknown";
}

TransactionEngine::TransactionEngine() = default;

void TransactionEngine::set_outcome_handler(OutcomeHandler handler) {
  outcome_handler_ = std::move(handler);
}

void TransactionEngine::apply(const Transaction& transaction) {
  const Outcome outcome = std::visit([this](const auto& tx) { return handle(tx); }, transaction);
  if (outcome_handler_) {
    outcome_handler_(transaction, outcome);
  }
}

std::vector<ledger::Account> TransactionEngine::snapshot() const {
  return accounts_.snapshot();
}

Outcome TransactionEngine::handle(const Deposit& deposit) {
  auto& account = accounts_.get_or_create(deposit.client);
  if (account.locked) {
    return Outcome::kAccountLocked;
  }

  const auto available = common::Amount::checked_add(account.available, deposit.amount);
  const auto total = common::Amount::checked_add(account.total, deposit.amount);
  if (!available || !total) {
    return Outcome::kBalanceOverflow;
  }
  account.available = *available;
  account.total = *total;

  ledger_.record(deposit.tx, ledger::LedgerEntry{
                                 .client = deposit.client,
                                 .tx = deposit.tx,
                                 .amount = deposit.amount,
                                 .state = ledger::DisputeState::kNone,
                             });
  return Outcome::kApplied;
}

Outcome TransactionEngine::handle(const Withdrawal& withdrawal) {
  auto& account = accounts_.get_or_create(withdrawal.client);
  if (account.locked) {
    return Outcome::kAccountLocked;
  }
  if (account.available < withdrawal.amount) {
    return Outcome::kInsufficientFunds;
  }

  account.available -= withdrawal.amount;
  account.total -= withdrawal.amount;
  return Outcome::kApplied;
}

// The dispute-family handlers address the account that owns the ledger entry,
// not the client named on the incoming record. Only deposit and dispute can
// grow a balance past 64 bits; resolve and chargeback move funds already held.

Outcome TransactionEngine::handle(const Dispute& dispute) {
  auto entry = ledger_.lookup(dispute.tx);
  if (!entry) {
    return Outcome::kUnknownTransaction;
  }
  if (entry->state != ledger::DisputeState::kNone) {
    return Outcome::kAlreadyDisputed;
  }

  auto& account = accounts_.get_or_create(entry->client);
  const auto available = common::Amount::checked_sub(account.available, entry->amount);
  const auto held = common::Amount::checked_add(account.held, entry->amount);
  if (!available || !held) {
    return Outcome::kBalanceOverflow;
  }
  account.available = *available;
  account.held = *held;

  entry->state = ledger::DisputeState::kDisputed;
  ledger_.record(dispute.tx, *entry);
  return Outcome::kApplied;
}

Outcome TransactionEngine::handle(const Resolve& resolve) {
  auto entry = ledger_.lookup(resolve.tx);
  if (!entry) {
    return Outcome::kUnknownTransaction;
  }
  if (entry->state != ledger::DisputeState::kDisputed) {
    return Outcome::kNotDisputed;
  }

  auto& account = accounts_.get_or_create(entry->client);
  account.available += entry->amount;
  account.held -= entry->amount;

  entry->state = ledger::DisputeState::kNone;
  ledger_.record(resolve.tx, *entry);
  return Outcome::kApplied;
}

Outcome TransactionEngine::handle(const Chargeback& chargeback) {
  auto entry = ledger_.lookup(chargeback.tx);
  if (!entry) {
    return Outcome::kUnknownTransaction;
  }
  if (entry->state != ledger::DisputeState::kDisputed) {
    return Outcome::kNotDisputed;
  }

  auto& account = accounts_.get_or_create(entry->client);
  account.total -= entry->amount;
  account.held -= entry->amount;
  account.locked = true;

  entry->state = ledger::DisputeState::kNone;
  ledger_.record(chargeback.tx, *entry);
  return Outcome::kApplied;
}

}  // namespace engine
}  // namespace clearcore
