#include "payengine/ledger/account.hpp"

#include <utility>

namespace payengine {
namespace ledger {

const char* to_string(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kIgnored:
      return "ignored";
    case Outcome::kUnknownClient:
      return "unknown client";
    case Outcome::kAccountLocked:
      return "account locked";
    case Outcome::kTransactionNotFound:
      return "transaction not found";
    case Outcome::kInsufficientFunds:
      return "insufficient funds";
  }
  return "unknown";
}

// Repeating a txn id overwrites the open record. A txn id under dispute keeps
// its held record, so an id never sits in both maps.
void Account::remember(common::TxnId txn, TransactionRecord record) {
  if (held_txns_.contains(txn)) {
    return;
  }
  open_txns_.insert_or_assign(txn, std::move(record));
}

Outcome Account::deposit(common::TxnId txn, common::PositiveDecimal amount) {
  const common::Decimal next_available = available_ + *amount;
  remember(txn, TransactionRecord{.kind = TxnKind::kDeposit, .amount = amount});
  available_ = next_available;
  return Outcome::kApplied;
}

Outcome Account::withdraw(common::TxnId txn, common::PositiveDecimal amount) {
  if (locked_) {
    return Outcome::kAccountLocked;
  }
  if (available_ < *amount) {
    return Outcome::kInsufficientFunds;
  }
  const common::Decimal next_available = available_ - *amount;
  remember(txn, TransactionRecord{.kind = TxnKind::kWithdrawal, .amount = amount});
  available_ = next_available;
  return Outcome::kApplied;
}

Outcome Account::dispute(common::TxnId txn) {
  if (locked_) {
    return Outcome::kAccountLocked;
  }
  auto it = open_txns_.find(txn);
  if (it == open_txns_.end()) {
    return Outcome::kTransactionNotFound;
  }

  const common::Decimal amount = it->second.type_adjusted_amount();
  const common::Decimal next_held = held_ + amount;
  const common::Decimal next_available = available_ - amount;

  held_txns_.insert_or_assign(txn, std::move(it->second));
  open_txns_.erase(it);
  held_ = next_held;
  available_ = next_available;
  return Outcome::kApplied;
}

Outcome Account::resolve(common::TxnId txn) {
  if (locked_) {
    return Outcome::kAccountLocked;
  }
  auto it = held_txns_.find(txn);
  if (it == held_txns_.end()) {
    return Outcome::kTransactionNotFound;
  }

  const common::Decimal amount = it->second.type_adjusted_amount();
  const common::Decimal next_held = held_ - amount;
  const common::Decimal next_available = available_ + amount;

  open_txns_.insert_or_assign(txn, std::move(it->second));
  held_txns_.erase(it);
  held_ = next_held;
  available_ = next_available;
  return Outcome::kApplied;
}

// The charged back amount leaves the account for good: it comes out of held
// and is not returned to available.
Outcome Account::chargeback(common::TxnId txn) {
  if (locked_) {
    return Outcome::kAccountLocked;
  }
  auto it = held_txns_.find(txn);
  if (it == held_txns_.end()) {
    return Outcome::kTransactionNotFound;
  }

  const common::Decimal next_held = held_ - it->second.type_adjusted_amount();

  held_txns_.erase(it);
  held_ = next_held;
  locked_ = true;
  return Outcome::kApplied;
}

AccountSnapshot Account::snapshot(common::ClientId client) const {
  return AccountSnapshot{
      .client = client,
      .available = available_,
      .held = held_,
      .total = available_ + held_,
      .locked = locked_,
  };
}

}  // namespace ledger
}  // namespace payengine
