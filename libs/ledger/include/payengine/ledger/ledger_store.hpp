#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "payengine/common/decimal.hpp"
#include "payengine/common/types.hpp"
#include "payengine/ledger/account.hpp"
#include "payengine/ledger/event.hpp"

namespace payengine {
namespace ledger {

enum class ErrorMode : std::uint8_t {
  kPermissive,  // rejections are logged at debug level and reported as kIgnored
  kStrict,      // rejections are reported to the caller with their reason
};

// Client id to account mapping. The five operations report the exact rejection
// reason; apply() is the entry point used by the event pipeline and folds
// rejections according to the configured ErrorMode.
class LedgerStore {
 public:
  explicit LedgerStore(ErrorMode mode = ErrorMode::kPermissive) noexcept : mode_(mode) {}
  virtual ~LedgerStore() = default;

  LedgerStore(const LedgerStore&) = delete;
  LedgerStore& operator=(const LedgerStore&) = delete;

  // Creates the account on first use. Allowed on locked accounts.
  virtual Outcome deposit(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) = 0;
  virtual Outcome withdraw(common::ClientId client, common::TxnId txn, common::PositiveDecimal amount) = 0;
  virtual Outcome dispute(common::ClientId client, common::TxnId txn) = 0;
  virtual Outcome resolve(common::ClientId client, common::TxnId txn) = 0;
  virtual Outcome chargeback(common::ClientId client, common::TxnId txn) = 0;

  [[nodiscard]] virtual std::optional<AccountSnapshot> snapshot(common::ClientId client) const = 0;
  // Sorted by ascending client id.
  [[nodiscard]] virtual std::vector<AccountSnapshot> snapshot_all() const = 0;

  Outcome apply(const Event& event);

  [[nodiscard]] ErrorMode error_mode() const noexcept { return mode_; }

 private:
  ErrorMode mode_;
};

}  // namespace ledger
}  // namespace payengine
