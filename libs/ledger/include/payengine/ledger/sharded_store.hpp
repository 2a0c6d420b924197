#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "payengine/ledger/ledger_store.hpp"

namespace payengine {
namespace ledger {

// Thread-safe store. Accounts are spread over shards by client id and each
// shard has its own mutex, so operations on one client are serialized while
// clients in other shards proceed in parallel.
class ShardedStore final : public LedgerStore {
 public:
  explicit ShardedStore(std::size_t shard_count = 16, ErrorMode mode = ErrorMode::kPermissive);

  Outcome deposit(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) override;
  Outcome withdraw(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) override;
  Outcome dispute(common::ClientId client, common::TxnId txn) override;
  Outcome resolve(common::ClientId client, common::TxnId txn) override;
  Outcome chargeback(common::ClientId client, common::TxnId txn) override;

  [[nodiscard]] std::optional<AccountSnapshot> snapshot(common::ClientId client) const override;
  [[nodiscard]] std::vector<AccountSnapshot> snapshot_all() const override;

  [[nodiscard]] std::size_t shard_count() const noexcept { return shards_.size(); }

 private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<common::ClientId, Account> accounts;
  };

  Shard& shard_for(common::ClientId client);
  const Shard& shard_for(common::ClientId client) const;

  template <typename Fn>
  Outcome with_account(common::ClientId client, Fn&& fn);

  std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace ledger
}  // namespace payengine
