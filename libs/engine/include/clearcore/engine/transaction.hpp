#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include "clearcore/common/amount.hpp"
#include "clearcore/common/types.hpp"

namespace clearcore {
namespace engine {

struct Deposit {
  common::ClientId client{};
  common::TxId tx{};
  common::Amount amount{};
};

struct Withdrawal {
  common::ClientId client{};
  common::TxId tx{};
  common::Amount amount{};
};

// Dispute, Resolve and Chargeback reference an earlier deposit by tx. Their
// client field is carried through from the log but never selects the account.
struct Dispute {
  common::ClientId client{};
  common::TxId tx{};
};

struct Resolve {
  common::ClientId client{};
  common::TxId tx{};
};

struct Chargeback {
  common::ClientId client{};
  common::TxId tx{};
};

using Transaction = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

// Order matches the variant alternatives.
enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

[[nodiscard]] inline TransactionKind kind_of(const Transaction& transaction) noexcept {
  return static_cast<TransactionKind>(transaction.index());
}

[[nodiscard]] std::string_view to_string(TransactionKind kind) noexcept;

}  // namespace engine
}  // namespace clearcore
