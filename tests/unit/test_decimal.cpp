#include "test_decimal.hpp"

#include <cassert>
#include <limits>
#include <stdexcept>
#include <string>

#include "payengine/common/decimal.hpp"

namespace payengine::tests {

using common::Decimal;
using common::PositiveDecimal;

void test_decimal_parse() {
  assert(Decimal::parse("100")->units() == 100 * Decimal::kScale);
  assert(Decimal::parse("0.0001")->units() == 10'000);
  assert(Decimal::parse("-77.89")->units() == -7'789'000'000);
  assert(Decimal::parse("+1.5")->units() == 150'000'000);
  assert(Decimal::parse(".5")->units() == 50'000'000);
  assert(Decimal::parse("2.")->units() == 200'000'000);
  assert(Decimal::parse("1.23461779")->units() == 123'461'779);

  assert(!Decimal::parse(""));
  assert(!Decimal::parse("-"));
  assert(!Decimal::parse("."));
  assert(!Decimal::parse("abc"));
  assert(!Decimal::parse("1.2.3"));
  assert(!Decimal::parse("1e5"));
  assert(!Decimal::parse(" 1"));

  // Fraction digits past the eighth round half away from zero.
  assert(Decimal::parse("1.000000001")->units() == 100'000'000);
  assert(Decimal::parse("0.123456789")->units() == 12'345'679);
  assert(Decimal::parse("0.123456785")->units() == 12'345'679);
  assert(Decimal::parse("0.1234567849999")->units() == 12'345'678);
  assert(Decimal::parse("-0.000000005")->units() == -1);
  assert(Decimal::parse("0.99999999999")->units() == 100'000'000);
  assert(!Decimal::parse("0.123456789x"));
  assert(!Decimal::parse("99999999999999"));
}

void test_decimal_arithmetic() {
  const auto a = *Decimal::parse("123.45");
  const auto b = *Decimal::parse("67.89");
  assert((a + b).to_string() == "191.34");
  assert((b - a).to_string() == "-55.56");
  assert((-a).to_string() == "-123.45");
  assert(b < a);
  assert(Decimal{}.is_zero());

  assert(Decimal::from_integer(300).to_string() == "300");
  assert(Decimal::parse("0.00000001")->to_string() == "0.00000001");
  assert(Decimal::parse("-0")->to_string() == "0");

  bool threw = false;
  try {
    (void)(Decimal::from_units(std::numeric_limits<std::int64_t>::max()) + Decimal::from_units(1));
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);
}

void test_decimal_round() {
  assert(Decimal::parse("1.234549")->round(4).to_string() == "1.2345");
  assert(Decimal::parse("0.0000499")->round(4).to_string() == "0");
  assert(Decimal::parse("1.23461779")->round(4).to_string() == "1.2346");
  assert(Decimal::parse("100.456789")->round(4).to_string() == "100.4568");
  assert(Decimal::parse("0.00005")->round(4).to_string() == "0.0001");
  assert(Decimal::parse("-0.00005")->round(4).to_string() == "-0.0001");
  assert(Decimal::parse("-1.23445")->round(4).to_string() == "-1.2345");
  assert(Decimal::parse("-0.00004")->round(4).to_string() == "0");
  assert(Decimal::parse("100.12")->round(4).to_string() == "100.12");
  assert(Decimal::parse("2.5")->round(0).to_string() == "3");
}

void test_positive_decimal() {
  const PositiveDecimal ok{*Decimal::parse("1.23")};
  assert(ok.value().to_string() == "1.23");
  assert(PositiveDecimal::try_from(*Decimal::parse("0.00000001")).has_value());
  assert(!PositiveDecimal::try_from(*Decimal::parse("0")).has_value());
  assert(!PositiveDecimal::try_from(*Decimal::parse("-1")).has_value());

  bool threw = false;
  try {
    PositiveDecimal invalid{*Decimal::parse("-123.45")};
    (void)invalid;
  } catch (const common::InvalidAmount& e) {
    threw = true;
    assert(e.value().to_string() == "-123.45");
    assert(std::string(e.what()).find("value must be positive and non-zero") != std::string::npos);
  }
  assert(threw);
}

}  // namespace payengine::tests
