#pragma once

#include <cstdint>
#include <unordered_map>

#include "payengine/common/decimal.hpp"
#include "payengine/common/types.hpp"
#include "payengine/ledger/transaction_record.hpp"

namespace payengine {
namespace ledger {

enum class Outcome : std::uint8_t {
  kApplied,
  kIgnored,
  kUnknownClient,
  kAccountLocked,
  kTransactionNotFound,
  kInsufficientFunds,
};

[[nodiscard]] const char* to_string(Outcome outcome) noexcept;

struct AccountSnapshot {
  common::ClientId client{0};
  common::Decimal available{};
  common::Decimal held{};
  common::Decimal total{};
  bool locked{false};

  friend bool operator==(const AccountSnapshot&, const AccountSnapshot&) = default;
};

// Balances and dispute bookkeeping of a single client. Every operation either
// applies fully or returns a rejection without touching any field.
class Account {
 public:
  Outcome deposit(common::TxnId txn, common::PositiveDecimal amount);
  Outcome withdraw(common::TxnId txn, common::PositiveDecimal amount);
  Outcome dispute(common::TxnId txn);
  Outcome resolve(common::TxnId txn);
  Outcome chargeback(common::TxnId txn);

  [[nodiscard]] const common::Decimal& available() const noexcept { return available_; }
  [[nodiscard]] const common::Decimal& held() const noexcept { return held_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }

  [[nodiscard]] AccountSnapshot snapshot(common::ClientId client) const;

 private:
  using RecordMap = std::unordered_map<common::TxnId, TransactionRecord>;

  void remember(common::TxnId txn, TransactionRecord record);

  common::Decimal available_{};
  common::Decimal held_{};
  bool locked_{false};
  RecordMap open_txns_{};
  RecordMap held_txns_{};
};

}  // namespace ledger
}  // namespace payengine
