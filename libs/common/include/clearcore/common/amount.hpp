#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace clearcore {
namespace common {

// Exact decimal quantity with four fractional digits, stored as a count of
// 1/10000 units. Balance arithmetic never goes through binary floating point.
class Amount {
 public:
  static constexpr int kDecimalPlaces = 4;
  static constexpr std::int64_t kScale = 10'000;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_units(std::int64_t units) noexcept {
    Amount amount;
    amount.units_ = units;
    return amount;
  }

  [[nodiscard]] static constexpr Amount zero() noexcept { return Amount{}; }

  // Accepts "12", "12.5", ".5", "12." with an optional leading '+'.
  // Rejects negatives and anything finer than 1/10000.
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }

  [[nodiscard]] std::string to_string() const;

  // Empty when the exact result does not fit in 64 bits.
  [[nodiscard]] static constexpr std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((rhs.units_ > 0 && lhs.units_ > kMax - rhs.units_) ||
        (rhs.units_ < 0 && lhs.units_ < kMin - rhs.units_)) {
      return std::nullopt;
    }
    return from_units(lhs.units_ + rhs.units_);
  }

  [[nodiscard]] static constexpr std::optional<Amount> checked_sub(Amount lhs, Amount rhs) noexcept {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((rhs.units_ < 0 && lhs.units_ > kMax + rhs.units_) ||
        (rhs.units_ > 0 && lhs.units_ < kMin + rhs.units_)) {
      return std::nullopt;
    }
    return from_units(lhs.units_ - rhs.units_);
  }

  constexpr Amount& operator+=(Amount other) noexcept {
    units_ += other.units_;
    return *this;
  }

  constexpr Amount& operator-=(Amount other) noexcept {
    units_ -= other.units_;
    return *this;
  }

  friend constexpr Amount operator+(Amount lhs, Amount rhs) noexcept { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) noexcept { return lhs -= rhs; }

  friend constexpr auto operator<=>(const Amount&, const Amount&) noexcept = default;
  friend constexpr bool operator==(const Amount&, const Amount&) noexcept = default;

 private:
  std::int64_t units_{0};
};

}  // namespace common
}  // namespace clearcore
