#include "payengine/common/decimal.hpp"

#include <array>
#include <limits>

namespace payengine {
namespace common {

namespace {

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

constexpr std::array<std::int64_t, Decimal::kFractionDigits + 1> kPowersOfTen = {
    1, 10, 100, 1'000, 10'000, 100'000, 1'000'000, 10'000'000, 100'000'000,
};

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

std::int64_t checked_add(std::int64_t lhs, std::int64_t rhs) {
  if ((rhs > 0 && lhs > kMax - rhs) || (rhs < 0 && lhs < kMin - rhs)) {
    throw std::overflow_error("decimal addition overflow");
  }
  return lhs + rhs;
}

std::int64_t checked_sub(std::int64_t lhs, std::int64_t rhs) {
  if ((rhs < 0 && lhs > kMax + rhs) || (rhs > 0 && lhs < kMin + rhs)) {
    throw std::overflow_error("decimal subtraction overflow");
  }
  return lhs - rhs;
}

}  // namespace

Decimal Decimal::from_integer(std::int64_t value) {
  if (value > kMax / kScale || value < kMin / kScale) {
    throw std::overflow_error("decimal integer out of range");
  }
  return Decimal{value * kScale};
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
  std::size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }

  std::int64_t whole = 0;
  std::size_t whole_digits = 0;
  while (pos < text.size() && is_digit(text[pos])) {
    const std::int64_t digit = text[pos] - '0';
    if (whole > (kMax / kScale - digit) / 10) {
      return std::nullopt;
    }
    whole = whole * 10 + digit;
    ++whole_digits;
    ++pos;
  }

  // Digits past kFractionDigits round the magnitude half away from zero.
  std::int64_t fraction = 0;
  std::size_t fraction_digits = 0;
  std::size_t extra_digits = 0;
  bool round_up = false;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && is_digit(text[pos])) {
      if (fraction_digits < kFractionDigits) {
        fraction = fraction * 10 + (text[pos] - '0');
        ++fraction_digits;
      } else {
        if (extra_digits == 0) {
          round_up = text[pos] >= '5';
        }
        ++extra_digits;
      }
      ++pos;
    }
  }

  if (pos != text.size() || whole_digits + fraction_digits == 0) {
    return std::nullopt;
  }

  const std::int64_t fraction_units =
      fraction * kPowersOfTen[kFractionDigits - fraction_digits] + (round_up ? 1 : 0);
  if (whole > (kMax - fraction_units) / kScale) {
    return std::nullopt;
  }
  const std::int64_t units = whole * kScale + fraction_units;
  return Decimal{negative ? -units : units};
}

Decimal Decimal::round(int fraction_digits) const {
  if (fraction_digits < 0) {
    throw std::invalid_argument("fraction digits must not be negative");
  }
  if (fraction_digits >= kFractionDigits) {
    return *this;
  }

  const std::int64_t divisor = kPowersOfTen[kFractionDigits - fraction_digits];
  std::int64_t quotient = units_ / divisor;
  const std::int64_t remainder = units_ % divisor;
  const std::int64_t magnitude = remainder < 0 ? -remainder : remainder;
  if (magnitude * 2 >= divisor) {
    quotient += units_ < 0 ? -1 : 1;
  }
  if (quotient > kMax / divisor || quotient < kMin / divisor) {
    throw std::overflow_error("decimal rounding overflow");
  }
  return Decimal{quotient * divisor};
}

std::string Decimal::to_string() const {
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(units_)
                                           : static_cast<std::uint64_t>(units_);
  const auto scale = static_cast<std::uint64_t>(kScale);

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / scale);

  std::uint64_t fraction = magnitude % scale;
  if (fraction == 0) {
    return out;
  }

  std::string digits(kFractionDigits, '0');
  for (int idx = kFractionDigits - 1; idx >= 0; --idx) {
    digits[static_cast<std::size_t>(idx)] = static_cast<char>('0' + fraction % 10);
    fraction /= 10;
  }
  digits.erase(digits.find_last_not_of('0') + 1);

  out.push_back('.');
  out += digits;
  return out;
}

Decimal Decimal::operator-() const {
  if (units_ == kMin) {
    throw std::overflow_error("decimal negation overflow");
  }
  return Decimal{-units_};
}

Decimal& Decimal::operator+=(Decimal rhs) {
  units_ = checked_add(units_, rhs.units_);
  return *this;
}

Decimal& Decimal::operator-=(Decimal rhs) {
  units_ = checked_sub(units_, rhs.units_);
  return *this;
}

InvalidAmount::InvalidAmount(const Decimal& value)
    : std::invalid_argument("value must be positive and non-zero: " + value.to_string()),
      value_(value) {}

PositiveDecimal::PositiveDecimal(Decimal value) : value_(value) {
  if (!value.is_positive()) {
    throw InvalidAmount(value);
  }
}

std::optional<PositiveDecimal> PositiveDecimal::try_from(Decimal value) noexcept {
  if (!value.is_positive()) {
    return std::nullopt;
  }
  return PositiveDecimal{value, Unchecked{}};
}

}  // namespace common
}  // namespace payengine
