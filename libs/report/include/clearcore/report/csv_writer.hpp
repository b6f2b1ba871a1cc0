#pragma once

#include <ostream>
#include <span>

#include "clearcore/ledger/account_store.hpp"

namespace clearcore {
namespace report {

struct WriterOptions {
  char delimiter{','};
  bool sort_by_client{false};
};

// Writes "client,available,held,total,locked" followed by one row per account.
void write_accounts(std::ostream& out, std::span<const ledger::Account> accounts, const WriterOptions& options = {});

}  // namespace report
}  // namespace clearcore
