#pragma once

#include <cstdint>

#include "payengine/common/decimal.hpp"

namespace payengine {
namespace ledger {

enum class TxnKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
};

// What an account remembers about a deposit or withdrawal so it can be disputed later.
struct TransactionRecord {
  TxnKind kind{TxnKind::kDeposit};
  common::PositiveDecimal amount;

  // Signed amount moved between available and held by dispute, resolve and
  // chargeback: positive for deposits, negative for withdrawals.
  [[nodiscard]] common::Decimal type_adjusted_amount() const {
    return kind == TxnKind::kDeposit ? amount.value() : -amount.value();
  }
};

}  // namespace ledger
}  // namespace payengine
