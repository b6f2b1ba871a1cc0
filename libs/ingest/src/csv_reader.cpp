#include "clearcore/ingest/csv_reader.hpp"

#include <array>
#include <charconv>
#include <utility>

namespace clearcore {
namespace ingest {

namespace {

constexpr std::array<std::string_view, 4> kHeader = {"type", "client", "tx", "amount"};

std::string_view trim(std::string_view text) {
  constexpr std::string_view kBlank = " \t\r";
  const auto first = text.find_first_not_of(kBlank);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kBlank);
  return text.substr(first, last - first + 1);
}

template <typename T>
std::optional<T> parse_id(std::string_view text) {
  T value{};
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

bool is_header(const std::vector<std::string_view>& fields) {
  if (fields.size() != kHeader.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kHeader.size(); ++i) {
    if (fields[i] != kHeader[i]) {
      return false;
    }
  }
  return true;
}

DecodeResult failure(std::string message) {
  return DecodeResult{.transaction = std::nullopt, .error = std::move(message)};
}

}  // namespace

std::vector<std::string_view> split_fields(std::string_view line, char delimiter, bool trim_fields) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto pos = line.find(delimiter, start);
    auto field = line.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
    fields.push_back(trim_fields ? trim(field) : field);
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  return fields;
}

DecodeResult decode_record(const std::vector<std::string_view>& fields) {
  if (fields.size() < 3 || fields.size() > 4) {
    return failure("expected 3 or 4 fields, got " + std::to_string(fields.size()));
  }

  const auto type = fields[0];
  const auto client = parse_id<common::ClientId>(fields[1]);
  if (!client) {
    return failure("invalid client id '" + std::string(fields[1]) + "'");
  }
  const auto tx = parse_id<common::TxId>(fields[2]);
  if (!tx) {
    return failure("invalid tx id '" + std::string(fields[2]) + "'");
  }
  const std::string_view amount_field = fields.size() == 4 ? fields[3] : std::string_view{};

  if (type == "deposit" || type == "withdrawal") {
    if (amount_field.empty()) {
      return failure(std::string(type) + " without amount");
    }
    const auto amount = common::Amount::parse(amount_field);
    if (!amount) {
      return failure("invalid amount '" + std::string(amount_field) + "'");
    }
    if (type == "deposit") {
      return DecodeResult{.transaction = engine::Deposit{.client = *client, .tx = *tx, .amount = *amount}};
    }
    return DecodeResult{.transaction = engine::Withdrawal{.client = *client, .tx = *tx, .amount = *amount}};
  }

  if (type == "dispute" || type == "resolve" || type == "chargeback") {
    if (!amount_field.empty()) {
      return failure(std::string(type) + " must not carry an amount");
    }
    if (type == "dispute") {
      return DecodeResult{.transaction = engine::Dispute{.client = *client, .tx = *tx}};
    }
    if (type == "resolve") {
      return DecodeResult{.transaction = engine::Resolve{.client = *client, .tx = *tx}};
    }
    return DecodeResult{.transaction = engine::Chargeback{.client = *client, .tx = *tx}};
  }

  return failure("unknown transaction type '" + std::string(type) + "'");
}

CsvReader::CsvReader(std::istream& input, Options options)
    : input_(input), options_(options) {}

void CsvReader::set_error_handler(ErrorHandler handler) {
  error_handler_ = std::move(handler);
}

bool CsvReader::next(engine::Transaction& out) {
  while (std::getline(input_, line_)) {
    ++stats_.lines;
    if (trim(line_).empty()) {
      continue;
    }

    std::string_view line = line_;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    const auto fields = split_fields(line, options_.delimiter, options_.trim_whitespace);

    // A first line that is neither the header nor a valid record is rejected.
    const bool expect_header = options_.has_header && !header_checked_;
    header_checked_ = true;
    if (expect_header && is_header(fields)) {
      continue;
    }

    auto result = decode_record(fields);
    if (!result.ok()) {
      reject(expect_header ? "unexpected header: " + result.error : std::move(result.error));
      continue;
    }

    ++stats_.decoded;
    out = std::move(*result.transaction);
    return true;
  }
  return false;
}

void CsvReader::reject(std::string message) {
  ++stats_.rejected;
  if (error_handler_) {
    error_handler_(DecodeError{.line = stats_.lines, .message = std::move(message)});
  }
}

}  // namespace ingest
}  // namespace clearcore
