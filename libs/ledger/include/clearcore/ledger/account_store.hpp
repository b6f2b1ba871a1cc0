#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "clearcore/common/amount.hpp"
#include "clearcore/common/types.hpp"

namespace clearcore {
namespace ledger {

// total == available + held after every applied operation. locked is never cleared.
struct Account {
  common::ClientId client{};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};
};

class AccountStore {
 public:
  // Creates a zero-balance, unlocked account on first reference.
  Account& get_or_create(common::ClientId client);
  [[nodiscard]] const Account* find(common::ClientId client) const;

  // Copy of every tracked account, unordered.
  [[nodiscard]] std::vector<Account> snapshot() const;
  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }

 private:
  std::unordered_map<common::ClientId, Account> accounts_{};
};

}  // namespace ledger
}  // namespace clearcore
