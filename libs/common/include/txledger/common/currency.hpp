#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace txledger {
namespace common {

// Fixed-point decimal with four fractional digits, stored as a count of
// 1/10000 units.
class Currency {
 public:
  static constexpr int kFractionDigits = 4;
  static constexpr std::int64_t kScale = 10'000;

  constexpr Currency() noexcept = default;

  [[nodiscard]] static constexpr Currency from_units(std::int64_t units) noexcept {
    Currency value;
    value.units_ = units;
    return value;
  }

  [[nodiscard]] static constexpr Currency from_whole(std::int64_t whole) noexcept {
    return from_units(whole * kScale);
  }

  // Accepts an optional sign, digits and an optional fraction. Digits past the
  // fourth fractional place must all be zero; no rounding is performed.
  [[nodiscard]] static std::optional<Currency> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }

  // Always renders exactly four fractional digits, e.g. "99.0000".
  [[nodiscard]] std::string to_string() const;

  constexpr Currency& operator+=(Currency other) noexcept {
    units_ += other.units_;
    return *this;
  }

  constexpr Currency& operator-=(Currency other) noexcept {
    units_ -= other.units_;
    return *this;
  }

  // Overflow-checked arithmetic; nullopt when the result does not fit.
  [[nodiscard]] constexpr std::optional<Currency> checked_add(Currency other) const noexcept {
    std::int64_t units = 0;
    if (__builtin_add_overflow(units_, other.units_, &units)) {
      return std::nullopt;
    }
    return from_units(units);
  }

  [[nodiscard]] constexpr std::optional<Currency> checked_sub(Currency other) const noexcept {
    std::int64_t units = 0;
    if (__builtin_sub_overflow(units_, other.units_, &units)) {
      return std::nullopt;
    }
    return from_units(units);
  }

  friend constexpr Currency operator+(Currency lhs, Currency rhs) noexcept { return lhs += rhs; }
  friend constexpr Currency operator-(Currency lhs, Currency rhs) noexcept { return lhs -= rhs; }

  friend constexpr bool operator==(Currency, Currency) noexcept = default;
  friend constexpr auto operator<=>(Currency, Currency) noexcept = default;

 private:
  std::int64_t units_{0};
};

}  // namespace common
}  // namespace txledger
