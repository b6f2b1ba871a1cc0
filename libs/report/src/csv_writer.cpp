#include "clearcore/report/csv_writer.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace clearcore {
namespace report {

void write_accounts(std::ostream& out, std::span<const ledger::Account> accounts, const WriterOptions& options) {
  std::vector<ledger::Account> rows(accounts.begin(), accounts.end());
  if (options.sort_by_client) {
    std::sort(rows.begin(), rows.end(),
              [](const ledger::Account& lhs, const ledger::Account& rhs) { return lhs.client < rhs.client; });
  }

  const char d = options.delimiter;
  out << "client" << d << "available" << d << "held" << d << "total" << d << "locked" << '\n';
  for (const auto& account : rows) {
    out << account.client << d
        << account.available.to_string() << d
        << account.held.to_string() << d
        << account.total.to_string() << d
        << (account.locked ? "true" : "false") << '\n';
  }

  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write account report");
  }
}

}  // namespace report
}  // namespace clearcore
