#pragma once

#include <variant>

#include "payengine/common/decimal.hpp"
#include "payengine/common/types.hpp"

namespace payengine {
namespace ledger {

struct Deposit {
  common::PositiveDecimal amount;
  friend bool operator==(const Deposit&, const Deposit&) = default;
};

struct Withdrawal {
  common::PositiveDecimal amount;
  friend bool operator==(const Withdrawal&, const Withdrawal&) = default;
};

struct Dispute {
  friend bool operator==(const Dispute&, const Dispute&) = default;
};

struct Resolve {
  friend bool operator==(const Resolve&, const Resolve&) = default;
};

struct Chargeback {
  friend bool operator==(const Chargeback&, const Chargeback&) = default;
};

using EventDetail = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

struct Event {
  common::ClientId client{0};
  common::TxnId txn{0};
  EventDetail detail;

  friend bool operator==(const Event&, const Event&) = default;
};

[[nodiscard]] const char* kind_name(const EventDetail& detail) noexcept;

}  // namespace ledger
}  // namespace payengine
