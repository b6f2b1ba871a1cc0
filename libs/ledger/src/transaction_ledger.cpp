#include "clearcore/ledger/transaction_ledger.hpp"

namespace clearcore {
namespace ledger {

void TransactionLedger::record(common::TxId tx, const LedgerEntry& entry) {
  entries_.insert_or_assign(tx, entry);
}

std::optional<LedgerEntry> TransactionLedger::lookup(common::TxId tx) const {
  if (auto it = entries_.find(tx); it != entries_.end()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace ledger
}  // namespace clearcore
