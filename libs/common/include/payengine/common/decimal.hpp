#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace payengine {
namespace common {

// Signed fixed-point amount with 8 fractional digits.
// Arithmetic throws std::overflow_error instead of wrapping.
class Decimal {
 public:
  static constexpr int kFractionDigits = 8;
  static constexpr std::int64_t kScale = 100'000'000;

  constexpr Decimal() noexcept = default;

  static constexpr Decimal from_units(std::int64_t units) noexcept { return Decimal{units}; }
  static Decimal from_integer(std::int64_t value);

  // Accepts [+-]digits[.digits]; nullopt on anything else. Fraction digits past
  // the eighth round half away from zero.
  static std::optional<Decimal> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return units_ == 0; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }
  [[nodiscard]] constexpr bool is_positive() const noexcept { return units_ > 0; }

  // Half away from zero.
  [[nodiscard]] Decimal round(int fraction_digits) const;
  [[nodiscard]] std::string to_string() const;

  Decimal operator-() const;
  Decimal& operator+=(Decimal rhs);
  Decimal& operator-=(Decimal rhs);

  friend Decimal operator+(Decimal lhs, Decimal rhs) { return lhs += rhs; }
  friend Decimal operator-(Decimal lhs, Decimal rhs) { return lhs -= rhs; }
  friend constexpr bool operator==(Decimal, Decimal) noexcept = default;
  friend constexpr auto operator<=>(Decimal, Decimal) noexcept = default;

 private:
  constexpr explicit Decimal(std::int64_t units) noexcept : units_(units) {}

  std::int64_t units_{0};
};

class InvalidAmount : public std::invalid_argument {
 public:
  explicit InvalidAmount(const Decimal& value);

  [[nodiscard]] const Decimal& value() const noexcept { return value_; }

 private:
  Decimal value_;
};

// A Decimal that is known to be strictly greater than zero.
class PositiveDecimal {
 public:
  // Throws InvalidAmount for zero or negative input.
  explicit PositiveDecimal(Decimal value);

  static std::optional<PositiveDecimal> try_from(Decimal value) noexcept;

  [[nodiscard]] const Decimal& value() const noexcept { return value_; }
  const Decimal& operator*() const noexcept { return value_; }

  friend bool operator==(const PositiveDecimal&, const PositiveDecimal&) noexcept = default;

 private:
  struct Unchecked {};
  PositiveDecimal(Decimal value, Unchecked) noexcept : value_(value) {}

  Decimal value_;
};

}  // namespace common
}  // namespace payengine
