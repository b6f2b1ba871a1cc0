#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "clearcore/engine/transaction.hpp"
#include "clearcore/ledger/account_store.hpp"
#include "clearcore/ledger/transaction_ledger.hpp"

namespace clearcore {
namespace engine {

enum class Outcome : std::uint8_t {
  kApplied,
  kAccountLocked,
  kInsufficientFunds,
  kUnknownTransaction,
  kAlreadyDisputed,
  kNotDisputed,
  kBalanceOverflow,
};

inline constexpr std::size_t kOutcomeCount = static_cast<std::size_t>(Outcome::kBalanceOverflow) + 1;

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;

// Replays transactions one at a time against an owned account store and
// deposit ledger. Inapplicable transactions are absorbed as no-ops; apply()
// never reports them. Register an outcome handler to observe them.
class TransactionEngine {
 public:
  using OutcomeHandler = std::function<void(const Transaction&, Outcome)>;

  TransactionEngine();

  void set_outcome_handler(OutcomeHandler handler);
  [[nodiscard]] const OutcomeHandler& outcome_handler() const noexcept { return outcome_handler_; }
  void apply(const Transaction& transaction);

  [[nodiscard]] std::vector<ledger::Account> snapshot() const;
  [[nodiscard]] const ledger::AccountStore& accounts() const noexcept { return accounts_; }
  [[nodiscard]] const ledger::TransactionLedger& ledger() const noexcept { return ledger_; }

 private:
  ledger::AccountStore accounts_{};
  ledger::TransactionLedger ledger_{};
  OutcomeHandler outcome_handler_{};

  Outcome handle(const Deposit& deposit);
  Outcome handle(const Withdrawal& withdrawal);
  Outcome handle(const Dispute& dispute);
  Outcome handle(const Resolve& resolve);
  Outcome handle(const Chargeback& chargeback);
};

}  // namespace engine
}  // namespace clearcore
