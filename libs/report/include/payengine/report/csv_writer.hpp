#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "payengine/common/decimal.hpp"
#include "payengine/ledger/account.hpp"

namespace payengine {
namespace report {

inline constexpr int kOutputFractionDigits = 4;

// Rounds half away from zero to 4 places and drops trailing fraction zeros.
[[nodiscard]] std::string format_amount(const common::Decimal& value);

// Writes `client,available,held,total,locked` rows. Nothing at all is written
// for an empty list. Throws std::runtime_error when the stream fails.
void write_snapshots(std::ostream& out, const std::vector<ledger::AccountSnapshot>& snapshots);

// Same rows as write_snapshots without the final newline.
[[nodiscard]] std::string to_csv_string(const std::vector<ledger::AccountSnapshot>& snapshots);

}  // namespace report
}  // namespace payengine
