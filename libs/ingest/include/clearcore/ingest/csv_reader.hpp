#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "clearcore/engine/transaction.hpp"

namespace clearcore {
namespace ingest {

struct DecodeError {
  std::uint64_t line{0};
  std::string message;
};

struct DecodeResult {
  std::optional<engine::Transaction> transaction;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return transaction.has_value(); }
};

// Decodes one record of the form type,client,tx[,amount]. Fields are expected
// to be trimmed already.
[[nodiscard]] DecodeResult decode_record(const std::vector<std::string_view>& fields);

// Splits a line on delimiter, optionally trimming blanks around each field.
[[nodiscard]] std::vector<std::string_view> split_fields(std::string_view line, char delimiter, bool trim);

// Pulls transactions out of a "type,client,tx,amount" log. Malformed records
// are reported to the error handler and skipped.
class CsvReader {
 public:
  struct Options {
    char delimiter{','};
    bool has_header{true};
    bool trim_whitespace{true};
  };

  struct Stats {
    std::uint64_t lines{0};
    std::uint64_t decoded{0};
    std::uint64_t rejected{0};
  };

  using ErrorHandler = std::function<void(const DecodeError&)>;

  CsvReader(std::istream& input, Options options);

  void set_error_handler(ErrorHandler handler);
  bool next(engine::Transaction& out);

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  std::istream& input_;
  Options options_{};
  ErrorHandler error_handler_{};
  Stats stats_{};
  std::string line_{};
  bool header_checked_{false};

  void reject(std::string message);
};

}  // namespace ingest
}  // namespace clearcore
