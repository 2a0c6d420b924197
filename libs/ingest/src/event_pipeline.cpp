#include "payengine/ingest/event_pipeline.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "payengine/common/spsc_ring.hpp"

namespace payengine {
namespace ingest {

namespace {

struct Lane {
  explicit Lane(std::size_t depth) : ring(depth) {}

  common::SpscRing<ledger::Event> ring;
  EventPipeline::Stats stats{};
  std::exception_ptr error;
};

}  // namespace

EventPipeline::Stats& EventPipeline::Stats::operator+=(const Stats& other) noexcept {
  rows_decoded += other.rows_decoded;
  rows_rejected += other.rows_rejected;
  applied += other.applied;
  ignored += other.ignored;
  rejected += other.rejected;
  failed += other.failed;
  return *this;
}

EventPipeline::EventPipeline(const Config& config) {
  configure(config);
}

void EventPipeline::configure(const Config& config) {
  if (config.workers > 0 && (config.queue_depth < 2 || (config.queue_depth & (config.queue_depth - 1)) != 0)) {
    throw std::invalid_argument("pipeline queue depth must be a power of two >= 2");
  }
  config_ = config;
}

EventPipeline::Stats EventPipeline::run(CsvEventReader& reader, ledger::LedgerStore& store) {
  if (config_.workers == 0) {
    return run_inline(reader, store);
  }
  return run_workers(reader, store);
}

bool EventPipeline::accept(const DecodedRow& row, Stats& stats) {
  if (!row.event) {
    ++stats.rows_rejected;
    spdlog::warn("skipping line {}: {}", row.line, row.error);
    return false;
  }
  ++stats.rows_decoded;
  return true;
}

void EventPipeline::apply(ledger::LedgerStore& store, const ledger::Event& event, Stats& stats) {
  try {
    const auto outcome = store.apply(event);
    switch (outcome) {
      case ledger::Outcome::kApplied:
        ++stats.applied;
        break;
      case ledger::Outcome::kIgnored:
        ++stats.ignored;
        break;
      default:
        ++stats.rejected;
        spdlog::warn("rejected {} client={} tx={}: {}", ledger::kind_name(event.detail), event.client,
                     event.txn, ledger::to_string(outcome));
        break;
    }
  } catch (const std::overflow_error& e) {
    ++stats.failed;
    spdlog::error("failed {} client={} tx={}: {}", ledger::kind_name(event.detail), event.client, event.txn,
                  e.what());
  }
}

EventPipeline::Stats EventPipeline::run_inline(CsvEventReader& reader, ledger::LedgerStore& store) {
  Stats stats;
  DecodedRow row;
  while (reader.next(row)) {
    if (accept(row, stats)) {
      apply(store, *row.event, stats);
    }
  }
  return stats;
}

// The reading thread is the single producer of every lane and each lane has a
// single worker. A client always maps to the same lane, which keeps its events
// in arrival order. A worker that throws stops the run; its exception is
// rethrown here once every thread has been joined.
EventPipeline::Stats EventPipeline::run_workers(CsvEventReader& reader, ledger::LedgerStore& store) {
  std::vector<std::unique_ptr<Lane>> lanes;
  lanes.reserve(config_.workers);
  for (std::size_t idx = 0; idx < config_.workers; ++idx) {
    lanes.push_back(std::make_unique<Lane>(config_.queue_depth));
  }

  std::atomic<bool> done{false};
  std::atomic<bool> failed{false};
  auto worker = [&store, &done, &failed](Lane* lane) {
    try {
      while (true) {
        if (auto event = lane->ring.try_pop()) {
          apply(store, *event, lane->stats);
          continue;
        }
        if (done.load(std::memory_order_acquire)) {
          while (auto event = lane->ring.try_pop()) {
            apply(store, *event, lane->stats);
          }
          return;
        }
        std::this_thread::yield();
      }
    } catch (const std::exception& e) {
      spdlog::error("pipeline worker stopped: {}", e.what());
      lane->error = std::current_exception();
      failed.store(true, std::memory_order_release);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(lanes.size());
  auto stop_workers = [&] {
    done.store(true, std::memory_order_release);
    for (auto& thread : threads) {
      thread.join();
    }
  };

  Stats stats;
  try {
    for (auto& lane : lanes) {
      threads.emplace_back(worker, lane.get());
    }

    DecodedRow row;
    while (!failed.load(std::memory_order_acquire) && reader.next(row)) {
      if (!accept(row, stats)) {
        continue;
      }
      auto& lane = *lanes[row.event->client % lanes.size()];
      while (!lane.ring.try_push(*row.event)) {
        if (failed.load(std::memory_order_acquire)) {
          break;
        }
        std::this_thread::yield();
      }
    }
  } catch (...) {
    stop_workers();
    throw;
  }
  stop_workers();

  for (const auto& lane : lanes) {
    if (lane->error) {
      std::rethrow_exception(lane->error);
    }
    stats += lane->stats;
  }
  return stats;
}

}  // namespace ingest
}  // namespace payengine
