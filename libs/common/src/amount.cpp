#include "clearcore/common/amount.hpp"

#include <limits>

namespace clearcore {
namespace common {

namespace {
// Largest whole part whose scaled value plus a full fraction still fits.
constexpr std::int64_t kMaxWhole = std::numeric_limits<std::int64_t>::max() / Amount::kScale - 1;

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}
}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  std::string_view whole = text;
  std::string_view fraction{};
  if (const auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
    if (fraction.find('.') != std::string_view::npos) {
      return std::nullopt;
    }
  }
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }

  std::int64_t whole_value = 0;
  for (const char c : whole) {
    if (!is_digit(c)) {
      return std::nullopt;
    }
    whole_value = whole_value * 10 + (c - '0');
    if (whole_value > kMaxWhole) {
      return std::nullopt;
    }
  }

  std::int64_t fraction_value = 0;
  for (std::size_t i = 0; i < fraction.size(); ++i) {
    const char c = fraction[i];
    if (!is_digit(c)) {
      return std::nullopt;
    }
    if (i < static_cast<std::size_t>(kDecimalPlaces)) {
      fraction_value = fraction_value * 10 + (c - '0');
    } else if (c != '0') {
      return std::nullopt;
    }
  }
  for (std::size_t i = fraction.size(); i < static_cast<std::size_t>(kDecimalPlaces); ++i) {
    fraction_value *= 10;
  }

  return Amount::from_units(whole_value * kScale + fraction_value);
}

std::string Amount::to_string() const {
  // Work on the magnitude as unsigned so INT64_MIN does not overflow.
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? (~static_cast<std::uint64_t>(units_) + 1)
                                           : static_cast<std::uint64_t>(units_);
  const std::uint64_t scale = static_cast<std::uint64_t>(kScale);

  std::string fraction = std::to_string(magnitude % scale);
  fraction.insert(0, static_cast<std::size_t>(kDecimalPlaces) - fraction.size(), '0');

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / scale);
  out.push_back('.');
  out += fraction;
  return out;
}

}  // namespace common
}  // namespace clearcore
