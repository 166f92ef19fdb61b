#include "txledger/common/currency.hpp"

#include <charconv>
#include <limits>

namespace txledger {
namespace common {

namespace {

bool all_digits(std::string_view text) noexcept {
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<Currency> Currency::parse(std::string_view text) {
  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  std::string_view whole = text;
  std::string_view fraction;
  if (const auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
  }

  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  if (!all_digits(whole) || !all_digits(fraction)) {
    return std::nullopt;
  }

  if (fraction.size() > static_cast<std::size_t>(kFractionDigits)) {
    if (fraction.find_first_not_of('0', kFractionDigits) != std::string_view::npos) {
      return std::nullopt;
    }
    fraction = fraction.substr(0, kFractionDigits);
  }

  std::int64_t whole_units = 0;
  if (!whole.empty()) {
    const auto [ptr, ec] = std::from_chars(whole.data(), whole.data() + whole.size(), whole_units);
    if (ec != std::errc{} || ptr != whole.data() + whole.size()) {
      return std::nullopt;
    }
  }

  std::int64_t fraction_units = 0;
  for (std::size_t i = 0; i < static_cast<std::size_t>(kFractionDigits); ++i) {
    fraction_units *= 10;
    if (i < fraction.size()) {
      fraction_units += fraction[i] - '0';
    }
  }

  if (whole_units > (std::numeric_limits<std::int64_t>::max() - fraction_units) / kScale) {
    return std::nullopt;
  }

  const std::int64_t units = whole_units * kScale + fraction_units;
  return from_units(negative ? -units : units);
}

std::string Currency::to_string() const {
  // Magnitude in unsigned space so the most negative value still renders.
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(units_)
                                           : static_cast<std::uint64_t>(units_);
  const std::uint64_t whole = magnitude / kScale;
  std::uint64_t fraction = magnitude % kScale;

  std::string out = negative ? "-" : "";
  out += std::to_string(whole);
  out += '.';
  char digits[kFractionDigits];
  for (int i = kFractionDigits - 1; i >= 0; --i) {
    digits[i] = static_cast<char>('0' + fraction % 10);
    fraction /= 10;
  }
  out.append(digits, kFractionDigits);
  return out;
}

}  // namespace common
}  // namespace txledger
