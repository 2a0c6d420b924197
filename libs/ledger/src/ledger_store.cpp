#include "payengine/ledger/ledger_store.hpp"

#include <type_traits>

#include <spdlog/spdlog.h>

namespace payengine {
namespace ledger {

const char* kind_name(const EventDetail& detail) noexcept {
  return std::visit(
      [](const auto& kind) -> const char* {
        using T = std::decay_t<decltype(kind)>;
        if constexpr (std::is_same_v<T, Deposit>) {
          return "deposit";
        } else if constexpr (std::is_same_v<T, Withdrawal>) {
          return "withdrawal";
        } else if constexpr (std::is_same_v<T, Dispute>) {
          return "dispute";
        } else if constexpr (std::is_same_v<T, Resolve>) {
          return "resolve";
        } else {
          static_assert(std::is_same_v<T, Chargeback>, "unhandled event kind");
          return "chargeback";
        }
      },
      detail);
}

Outcome LedgerStore::apply(const Event& event) {
  const Outcome outcome = std::visit(
      [&](const auto& detail) -> Outcome {
        using T = std::decay_t<decltype(detail)>;
        if constexpr (std::is_same_v<T, Deposit>) {
          return deposit(event.client, event.txn, detail.amount);
        } else if constexpr (std::is_same_v<T, Withdrawal>) {
          return withdraw(event.client, event.txn, detail.amount);
        } else if constexpr (std::is_same_v<T, Dispute>) {
          return dispute(event.client, event.txn);
        } else if constexpr (std::is_same_v<T, Resolve>) {
          return resolve(event.client, event.txn);
        } else {
          static_assert(std::is_same_v<T, Chargeback>, "unhandled event kind");
          return chargeback(event.client, event.txn);
        }
      },
      event.detail);

  if (outcome == Outcome::kApplied || mode_ == ErrorMode::kStrict) {
    return outcome;
  }

  spdlog::debug("ignoring {} client={} tx={}: {}", kind_name(event.detail), event.client, event.txn,
                to_string(outcome));
  return Outcome::kIgnored;
}

}  // namespace ledger
}  // namespace payengine
