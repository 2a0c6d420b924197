#include "payengine/ledger/sharded_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace payengine {
namespace ledger {

ShardedStore::ShardedStore(std::size_t shard_count, ErrorMode mode) : LedgerStore(mode) {
  if (shard_count == 0) {
    throw std::invalid_argument("ShardedStore needs at least one shard");
  }
  shards_.reserve(shard_count);
  for (std::size_t idx = 0; idx < shard_count; ++idx) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

ShardedStore::Shard& ShardedStore::shard_for(common::ClientId client) {
  return *shards_[client % shards_.size()];
}

const ShardedStore::Shard& ShardedStore::shard_for(common::ClientId client) const {
  return *shards_[client % shards_.size()];
}

template <typename Fn>
Outcome ShardedStore::with_account(common::ClientId client, Fn&& fn) {
  auto& shard = shard_for(client);
  std::scoped_lock lock(shard.mutex);
  auto it = shard.accounts.find(client);
  if (it == shard.accounts.end()) {
    return Outcome::kUnknownClient;
  }
  return fn(it->second);
}

Outcome ShardedStore::deposit(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) {
  auto& shard = shard_for(client);
  std::scoped_lock lock(shard.mutex);
  return shard.accounts[client].deposit(txn, amount);
}

Outcome ShardedStore::withdraw(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) {
  return with_account(client, [&](Account& account) { return account.withdraw(txn, amount); });
}

Outcome ShardedStore::dispute(common::ClientId client, common::TxnId txn) {
  return with_account(client, [&](Account& account) { return account.dispute(txn); });
}

Outcome ShardedStore::resolve(common::ClientId client, common::TxnId txn) {
  return with_account(client, [&](Account& account) { return account.resolve(txn); });
}

Outcome ShardedStore::chargeback(common::ClientId client, common::TxnId txn) {
  return with_account(client, [&](Account& account) { return account.chargeback(txn); });
}

std::optional<AccountSnapshot> ShardedStore::snapshot(common::ClientId client) const {
  const auto& shard = shard_for(client);
  std::scoped_lock lock(shard.mutex);
  if (auto it = shard.accounts.find(client); it != shard.accounts.end()) {
    return it->second.snapshot(client);
  }
  return std::nullopt;
}

// Each account is read under its shard lock. Shards are visited one at a
// time, so the result is consistent per account, not across the whole store.
std::vector<AccountSnapshot> ShardedStore::snapshot_all() const {
  std::vector<AccountSnapshot> snapshots;
  for (const auto& shard : shards_) {
    std::scoped_lock lock(shard->mutex);
    for (const auto& [client, account] : shard->accounts) {
      snapshots.push_back(account.snapshot(client));
    }
  }
  std::sort(snapshots.begin(), snapshots.end(),
            [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) { return lhs.client < rhs.client; });
  return snapshots;
}

}  // namespace ledger
}  // namespace payengine
