#pragma once

#include <unordered_map>

#include "payengine/ledger/ledger_store.hpp"

namespace payengine {
namespace ledger {

// Single-threaded store. Callers serialize all access.
class InMemoryStore final : public LedgerStore {
 public:
  explicit InMemoryStore(ErrorMode mode = ErrorMode::kPermissive) noexcept : LedgerStore(mode) {}

  Outcome deposit(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) override;
  Outcome withdraw(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) override;
  Outcome dispute(common::ClientId client, common::TxnId txn) override;
  Outcome resolve(common::ClientId client, common::TxnId txn) override;
  Outcome chargeback(common::ClientId client, common::TxnId txn) override;

  [[nodiscard]] std::optional<AccountSnapshot> snapshot(common::ClientId client) const override;
  [[nodiscard]] std::vector<AccountSnapshot> snapshot_all() const override;

 private:
  Account* find_account(common::ClientId client);

  std::unordered_map<common::ClientId, Account> accounts_{};
};

}  // namespace ledger
}  // namespace payengine
