#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "payengine/common/logging.hpp"
#include "payengine/config/config_loader.hpp"
#include "payengine/ingest/csv_reader.hpp"
#include "payengine/ingest/event_pipeline.hpp"
#include "payengine/ledger/in_memory_store.hpp"
#include "payengine/ledger/sharded_store.hpp"
#include "payengine/report/csv_writer.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: type,client,tx,amount rows with a header\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./payengine.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./payengine.toml",
      "/etc/payengine/payengine.toml",
      home ? std::filesystem::path{home} / ".config/payengine/payengine.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(const std::filesystem::path& path, payengine::config::EngineConfig& out) {
  using payengine::config::ConfigLoader;

  auto result = path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                             : ConfigLoader::load(path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  out = std::move(result.config);
  return true;
}

std::unique_ptr<payengine::ledger::LedgerStore> make_store(const payengine::config::LedgerConfig& cfg) {
  using namespace payengine;
  switch (cfg.backend) {
    case config::Backend::kSharded:
      return std::make_unique<ledger::ShardedStore>(cfg.shard_count, cfg.error_mode);
    case config::Backend::kInMemory:
      break;
  }
  return std::make_unique<ledger::InMemoryStore>(cfg.error_mode);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payengine;

  if (argc < 2 || argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  const auto config_path = find_config_path(argc, argv);
  config::EngineConfig cfg;
  if (!load_config(config_path, cfg)) {
    return 1;
  }

  common::init_logging(cfg.logging.level);
  if (config_path.empty()) {
    spdlog::debug("no config file found, using defaults");
  } else {
    spdlog::debug("loaded config from {}", config_path.string());
  }

  const std::filesystem::path input_path{argv[1]};
  std::ifstream input(input_path);
  if (!input) {
    spdlog::error("cannot open input file {}", input_path.string());
    return 1;
  }

  auto store = make_store(cfg.ledger);
  ingest::EventPipeline pipeline;

  try {
    pipeline.configure({.workers = cfg.pipeline.workers, .queue_depth = cfg.pipeline.queue_depth});
    ingest::CsvEventReader reader(input);
    const auto stats = pipeline.run(reader, *store);
    spdlog::info("processed {} events ({} applied, {} ignored, {} rejected, {} failed), skipped {} rows",
                 stats.rows_decoded, stats.applied, stats.ignored, stats.rejected, stats.failed,
                 stats.rows_rejected);

    report::write_snapshots(std::cout, store->snapshot_all());
  } catch (const ingest::HeaderError& e) {
    spdlog::error("{}: {}", input_path.string(), e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
