#include "test_ledger.hpp"

#include <cassert>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "payengine/ledger/in_memory_store.hpp"
#include "payengine/ledger/sharded_store.hpp"
#include "test_support.hpp"

namespace payengine::tests {

using ledger::Outcome;

void test_ledger_deposits_only() {
  ledger::InMemoryStore store;
  assert(store.deposit(1, 1, amount("10.5")) == Outcome::kApplied);
  assert(store.deposit(1, 2, amount("0.25")) == Outcome::kApplied);
  assert(store.deposit(1, 3, amount("89.25")) == Outcome::kApplied);

  const auto account = store.snapshot(1);
  assert(account.has_value());
  assert(account->available == dec("100"));
  assert(account->total == dec("100"));
  assert(account->held.is_zero());
  assert(!account->locked);
  assert(!store.snapshot(2).has_value());

  ledger::InMemoryStore csv_store;
  assert(run_csv(csv_store, "type,client,tx,amount\n"
                            "deposit,1,101,100.456789") ==
         "client,available,held,total,locked\n"
         "1,100.4568,0,100.4568,false");
}

void test_ledger_withdrawal() {
  ledger::InMemoryStore store;
  assert(store.deposit(1, 101, amount("100.456789")) == Outcome::kApplied);
  assert(store.withdraw(1, 102, amount("100")) == Outcome::kApplied);
  assert(store.withdraw(1, 103, amount("1")) == Outcome::kInsufficientFunds);
  assert(store.withdraw(1, 104, amount("0.456789")) == Outcome::kApplied);
  assert(store.snapshot(1)->available.is_zero());
}

void test_ledger_dispute_resolve() {
  ledger::InMemoryStore store;
  const auto header = "type,client,tx,amount\n";
  assert(run_csv(store, std::string(header) + "deposit,1,101,100\ndeposit,1,102,20") ==
         "client,available,held,total,locked\n1,120,0,120,false");
  assert(run_csv(store, std::string(header) + "dispute,1,102,") ==
         "client,available,held,total,locked\n1,100,20,120,false");
  assert(run_csv(store, std::string(header) + "resolve,1,102,") ==
         "client,available,held,total,locked\n1,120,0,120,false");

  // A second resolve has nothing under dispute.
  assert(store.resolve(1, 102) == Outcome::kTransactionNotFound);
  // Resolved transactions can be disputed again.
  assert(store.dispute(1, 102) == Outcome::kApplied);
  assert(store.dispute(1, 102) == Outcome::kTransactionNotFound);
}

void test_ledger_dispute_resolve_withdrawal() {
  ledger::InMemoryStore store;
  const auto header = "type,client,tx,amount\n";
  assert(run_csv(store, std::string(header) + "deposit,1,101,100\nwithdrawal,1,102,20") ==
         "client,available,held,total,locked\n1,80,0,80,false");
  assert(run_csv(store, std::string(header) + "dispute,1,102,") ==
         "client,available,held,total,locked\n1,100,-20,80,false");
  assert(run_csv(store, std::string(header) + "resolve,1,102,") ==
         "client,available,held,total,locked\n1,80,0,80,false");

  // Disputing a withdrawal after spending the rest drives available negative.
  assert(store.withdraw(1, 103, amount("80")) == Outcome::kApplied);
  assert(store.dispute(1, 101) == Outcome::kApplied);
  const auto account = store.snapshot(1);
  assert(account->available == dec("-100"));
  assert(account->held == dec("100"));
  assert(account->total.is_zero());
}

void test_ledger_dispute_chargeback() {
  ledger::InMemoryStore store;
  const auto header = "type,client,tx,amount\n";
  assert(run_csv(store, std::string(header) + "deposit,1,101,100\ndeposit,1,102,20") ==
         "client,available,held,total,locked\n1,120,0,120,false");
  assert(run_csv(store, std::string(header) + "dispute,1,102,") ==
         "client,available,held,total,locked\n1,100,20,120,false");
  assert(run_csv(store, std::string(header) + "chargeback,1,102,") ==
         "client,available,held,total,locked\n1,100,0,100,true");
  assert(run_csv(store, std::string(header) + "deposit,1,103,111\nwithdrawal,1,103,11") ==
         "client,available,held,total,locked\n1,211,0,211,true");
}

void test_ledger_locked_account() {
  ledger::InMemoryStore store;
  assert(store.deposit(3, 1, amount("50")) == Outcome::kApplied);
  assert(store.deposit(3, 2, amount("30")) == Outcome::kApplied);
  assert(store.dispute(3, 1) == Outcome::kApplied);
  assert(store.dispute(3, 2) == Outcome::kApplied);
  assert(store.chargeback(3, 1) == Outcome::kApplied);

  const auto locked = *store.snapshot(3);
  assert(locked.locked);
  assert(locked.held == dec("30"));
  assert(locked.available.is_zero());

  assert(store.withdraw(3, 4, amount("1")) == Outcome::kAccountLocked);
  assert(store.resolve(3, 2) == Outcome::kAccountLocked);
  assert(store.chargeback(3, 2) == Outcome::kAccountLocked);
  assert(store.dispute(3, 2) == Outcome::kAccountLocked);
  assert(*store.snapshot(3) == locked);

  assert(store.deposit(3, 5, amount("5")) == Outcome::kApplied);
  assert(store.dispute(3, 5) == Outcome::kAccountLocked);
  assert(store.snapshot(3)->available == dec("5"));
}

void test_ledger_unknown_client() {
  ledger::InMemoryStore store;
  assert(store.withdraw(9, 1, amount("1")) == Outcome::kUnknownClient);
  assert(store.dispute(9, 1) == Outcome::kUnknownClient);
  assert(store.resolve(9, 1) == Outcome::kUnknownClient);
  assert(store.chargeback(9, 1) == Outcome::kUnknownClient);
  assert(store.snapshot_all().empty());

  // Disputes are scoped to the client that owns the transaction.
  assert(store.deposit(1, 1, amount("10")) == Outcome::kApplied);
  assert(store.deposit(2, 2, amount("10")) == Outcome::kApplied);
  assert(store.dispute(2, 1) == Outcome::kTransactionNotFound);
}

void test_ledger_repeated_txn_id() {
  ledger::InMemoryStore store;
  assert(store.deposit(1, 1, amount("10")) == Outcome::kApplied);
  assert(store.deposit(1, 1, amount("5")) == Outcome::kApplied);
  assert(store.snapshot(1)->available == dec("15"));
  assert(store.dispute(1, 1) == Outcome::kApplied);
  assert(store.snapshot(1)->held == dec("5"));
  assert(store.resolve(1, 1) == Outcome::kApplied);

  // Reusing an id that is under dispute credits the funds but keeps the
  // disputed record.
  ledger::InMemoryStore held_store;
  assert(held_store.deposit(1, 2, amount("10")) == Outcome::kApplied);
  assert(held_store.dispute(1, 2) == Outcome::kApplied);
  assert(held_store.deposit(1, 2, amount("3")) == Outcome::kApplied);
  assert(held_store.snapshot(1)->available == dec("3"));
  assert(held_store.resolve(1, 2) == Outcome::kApplied);
  assert(held_store.snapshot(1)->available == dec("13"));
  assert(held_store.dispute(1, 2) == Outcome::kApplied);
  assert(held_store.snapshot(1)->held == dec("10"));
}

void test_ledger_error_modes() {
  const auto deposit = ledger::Event{.client = 1, .txn = 1, .detail = ledger::Deposit{amount("10")}};
  const auto too_large = ledger::Event{.client = 1, .txn = 2, .detail = ledger::Withdrawal{amount("11")}};
  const auto unknown = ledger::Event{.client = 2, .txn = 3, .detail = ledger::Withdrawal{amount("1")}};
  const auto missing = ledger::Event{.client = 1, .txn = 99, .detail = ledger::Dispute{}};
  const auto dispute = ledger::Event{.client = 1, .txn = 1, .detail = ledger::Dispute{}};
  const auto chargeback = ledger::Event{.client = 1, .txn = 1, .detail = ledger::Chargeback{}};
  const auto resolve = ledger::Event{.client = 1, .txn = 1, .detail = ledger::Resolve{}};

  ledger::InMemoryStore strict{ledger::ErrorMode::kStrict};
  assert(strict.error_mode() == ledger::ErrorMode::kStrict);
  assert(strict.apply(deposit) == Outcome::kApplied);
  assert(strict.apply(too_large) == Outcome::kInsufficientFunds);
  assert(strict.apply(unknown) == Outcome::kUnknownClient);
  assert(strict.apply(missing) == Outcome::kTransactionNotFound);
  assert(strict.apply(dispute) == Outcome::kApplied);
  assert(strict.apply(chargeback) == Outcome::kApplied);
  assert(strict.apply(resolve) == Outcome::kAccountLocked);

  ledger::InMemoryStore permissive;
  assert(permissive.error_mode() == ledger::ErrorMode::kPermissive);
  assert(permissive.apply(deposit) == Outcome::kApplied);
  assert(permissive.apply(too_large) == Outcome::kIgnored);
  assert(permissive.apply(unknown) == Outcome::kIgnored);
  assert(permissive.apply(missing) == Outcome::kIgnored);
  assert(permissive.apply(dispute) == Outcome::kApplied);
  assert(permissive.apply(chargeback) == Outcome::kApplied);
  assert(permissive.apply(resolve) == Outcome::kIgnored);

  // Both modes leave identical balances behind.
  assert(strict.snapshot_all() == permissive.snapshot_all());
  assert(!permissive.snapshot(2).has_value());
}

void test_ledger_overflow_leaves_account_intact() {
  ledger::InMemoryStore store;
  const auto near_max = common::PositiveDecimal{
      common::Decimal::from_units(std::numeric_limits<std::int64_t>::max() - 10)};
  assert(store.deposit(1, 1, near_max) == Outcome::kApplied);
  const auto before = *store.snapshot(1);

  bool threw = false;
  try {
    (void)store.deposit(1, 2, amount("1"));
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);
  assert(*store.snapshot(1) == before);
  assert(store.dispute(1, 2) == Outcome::kTransactionNotFound);
}

void test_sharded_store_matches_in_memory() {
  const auto csv =
      "type,client,tx,amount\n"
      "deposit,1,1,100\n"
      "deposit,2,2,50\n"
      "deposit,17,3,20\n"
      "withdrawal,2,4,10\n"
      "dispute,2,4,\n"
      "dispute,1,1,\n"
      "chargeback,1,1,\n"
      "deposit,1,5,7.12345\n"
      "withdrawal,17,6,25\n";

  ledger::InMemoryStore in_memory;
  ledger::ShardedStore sharded{4};
  assert(sharded.shard_count() == 4);
  const auto expected = run_csv(in_memory, csv);
  assert(run_csv(sharded, csv) == expected);
  assert(expected ==
         "client,available,held,total,locked\n"
         "1,7.1235,0,7.1235,true\n"
         "2,50,-10,40,false\n"
         "17,20,0,20,false");

  bool threw = false;
  try {
    ledger::ShardedStore invalid{0};
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void test_event_kind_names() {
  assert(std::string_view(ledger::kind_name(ledger::Deposit{amount("1")})) == "deposit");
  assert(std::string_view(ledger::kind_name(ledger::Withdrawal{amount("1")})) == "withdrawal");
  assert(std::string_view(ledger::kind_name(ledger::Dispute{})) == "dispute");
  assert(std::string_view(ledger::kind_name(ledger::Resolve{})) == "resolve");
  assert(std::string_view(ledger::kind_name(ledger::Chargeback{})) == "chargeback");
}

}  // namespace payengine::tests
