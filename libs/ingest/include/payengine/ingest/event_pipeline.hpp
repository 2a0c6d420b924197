#pragma once

#include <cstddef>
#include <cstdint>

#include "payengine/ingest/csv_reader.hpp"
#include "payengine/ledger/ledger_store.hpp"

namespace payengine {
namespace ingest {

// Drains a CsvEventReader into a LedgerStore. Rejected rows, rejected events
// and arithmetic overflows are logged and counted. Any other exception thrown
// by the store ends the run and reaches the caller, from worker threads too.
class EventPipeline {
 public:
  struct Config {
    // 0 applies events on the calling thread. Otherwise events are routed by
    // client id to this many worker threads; the store must be thread-safe.
    std::size_t workers{0};
    std::size_t queue_depth{1 << 12};
  };

  struct Stats {
    std::uint64_t rows_decoded{0};
    std::uint64_t rows_rejected{0};
    std::uint64_t applied{0};
    std::uint64_t ignored{0};
    std::uint64_t rejected{0};
    std::uint64_t failed{0};

    Stats& operator+=(const Stats& other) noexcept;
  };

  EventPipeline() = default;
  explicit EventPipeline(const Config& config);

  void configure(const Config& config);
  Stats run(CsvEventReader& reader, ledger::LedgerStore& store);

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  Stats run_inline(CsvEventReader& reader, ledger::LedgerStore& store);
  Stats run_workers(CsvEventReader& reader, ledger::LedgerStore& store);

  static bool accept(const DecodedRow& row, Stats& stats);
  static void apply(ledger::LedgerStore& store, const ledger::Event& event, Stats& stats);

  Config config_{};
};

}  // namespace ingest
}  // namespace payengine
