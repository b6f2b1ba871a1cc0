#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "clearcore/common/amount.hpp"
#include "clearcore/common/types.hpp"

namespace clearcore {
namespace ledger {

enum class DisputeState : std::uint8_t {
  kNone,
  kDisputed,
};

// Retained record of a deposit. Only deposits can be disputed.
struct LedgerEntry {
  common::ClientId client{};
  common::TxId tx{};
  common::Amount amount{};
  DisputeState state{DisputeState::kNone};
};

class TransactionLedger {
 public:
  // Inserts or overwrites the entry for tx.
  void record(common::TxId tx, const LedgerEntry& entry);
  [[nodiscard]] std::optional<LedgerEntry> lookup(common::TxId tx) const;
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  std::unordered_map<common::TxId, LedgerEntry> entries_{};
};

}  // namespace ledger
}  // namespace clearcore
