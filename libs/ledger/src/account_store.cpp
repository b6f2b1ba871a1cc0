#include "clearcore/ledger/account_store.hpp"

namespace clearcore {
namespace ledger {

Account& AccountStore::get_or_create(common::ClientId client) {
  auto [it, inserted] = accounts_.try_emplace(client, Account{.client = client});
  return it->second;
}

const Account* AccountStore::find(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return &it->second;
  }
  return nullptr;
}

std::vector<Account> AccountStore::snapshot() const {
  std::vector<Account> accounts;
  accounts.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    accounts.push_back(account);
  }
  return accounts;
}

}  // namespace ledger
}  // namespace clearcore
