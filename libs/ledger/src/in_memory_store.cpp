#include "payengine/ledger/in_memory_store.hpp"

#include <algorithm>

namespace payengine {
namespace ledger {

Account* InMemoryStore::find_account(common::ClientId client) {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

Outcome InMemoryStore::deposit(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) {
  return accounts_[client].deposit(txn, amount);
}

Outcome InMemoryStore::withdraw(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) {
  auto* account = find_account(client);
  return account ? account->withdraw(txn, amount) : Outcome::kUnknownClient;
}

Outcome InMemoryStore::dispute(common::ClientId client, common::TxnId txn) {
  auto* account = find_account(client);
  return account ? account->dispute(txn) : Outcome::kUnknownClient;
}

Outcome InMemoryStore::resolve(common::ClientId client, common::TxnId txn) {
  auto* account = find_account(client);
  return account ? account->resolve(txn) : Outcome::kUnknownClient;
}

Outcome InMemoryStore::chargeback(common::ClientId client, common::TxnId txn) {
  auto* account = find_account(client);
  return account ? account->chargeback(txn) : Outcome::kUnknownClient;
}

std::optional<AccountSnapshot> InMemoryStore::snapshot(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return it->second.snapshot(client);
  }
  return std::nullopt;
}

std::vector<AccountSnapshot> InMemoryStore::snapshot_all() const {
  std::vector<AccountSnapshot> snapshots;
  snapshots.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    snapshots.push_back(account.snapshot(client));
  }
  std::sort(snapshots.begin(), snapshots.end(),
            [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) { return lhs.client < rhs.client; });
  return snapshots;
}

}  // namespace ledger
}  // namespace payengine
