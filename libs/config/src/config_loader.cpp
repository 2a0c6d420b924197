#include "payengine/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

#include "payengine/common/logging.hpp"

namespace payengine {
namespace config {

namespace {

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

// Negative values are reported and leave the default in place.
std::size_t get_size_or(const toml::table& tbl, std::string_view key, std::size_t default_val,
                        const std::string& field, std::vector<ValidationError>& errors) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    if (*val < 0) {
      errors.push_back({field, "must not be negative"});
      return default_val;
    }
    return static_cast<std::size_t>(*val);
  }
  return default_val;
}

LedgerConfig parse_ledger(const toml::table& root, std::vector<ValidationError>& errors) {
  LedgerConfig cfg;
  if (auto* tbl = root["ledger"].as_table()) {
    const auto mode = get_str_or(*tbl, "error_mode", "permissive");
    if (mode == "permissive") {
      cfg.error_mode = ledger::ErrorMode::kPermissive;
    } else if (mode == "strict") {
      cfg.error_mode = ledger::ErrorMode::kStrict;
    } else {
      errors.push_back({"ledger.error_mode", "must be \"permissive\" or \"strict\", got \"" + mode + "\""});
    }

    const auto backend = get_str_or(*tbl, "backend", "in_memory");
    if (backend == "in_memory") {
      cfg.backend = Backend::kInMemory;
    } else if (backend == "sharded") {
      cfg.backend = Backend::kSharded;
    } else {
      errors.push_back({"ledger.backend", "must be \"in_memory\" or \"sharded\", got \"" + backend + "\""});
    }

    cfg.shard_count = get_size_or(*tbl, "shard_count", cfg.shard_count, "ledger.shard_count", errors);
  }
  return cfg;
}

PipelineConfig parse_pipeline(const toml::table& root, std::vector<ValidationError>& errors) {
  PipelineConfig cfg;
  if (auto* tbl = root["pipeline"].as_table()) {
    cfg.workers = get_size_or(*tbl, "workers", cfg.workers, "pipeline.workers", errors);
    cfg.queue_depth = get_size_or(*tbl, "queue_depth", cfg.queue_depth, "pipeline.queue_depth", errors);
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* tbl = root["logging"].as_table()) {
    cfg.level = get_str_or(*tbl, "level", cfg.level);
  }
  return cfg;
}

LoadResult parse_config(const toml::table& root) {
  LoadResult result;
  result.config.ledger = parse_ledger(root, result.errors);
  result.config.pipeline = parse_pipeline(root, result.errors);
  result.config.logging = parse_logging(root);

  auto validation = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), validation.begin(), validation.end());
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return parse_config(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return parse_config(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.ledger.shard_count == 0) {
    errors.push_back({"ledger.shard_count", "must be greater than 0"});
  }

  const auto depth = config.pipeline.queue_depth;
  if (depth < 2 || (depth & (depth - 1)) != 0) {
    errors.push_back({"pipeline.queue_depth", "must be a power of two >= 2"});
  }

  if (config.pipeline.workers > 0 && config.ledger.backend != Backend::kSharded) {
    errors.push_back({"pipeline.workers", "worker threads require ledger.backend = \"sharded\""});
  }

  if (!common::is_valid_log_level(config.logging.level)) {
    errors.push_back({"logging.level", "unknown log level \"" + config.logging.level + "\""});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# payengine configuration
# Generated default configuration

[ledger]
error_mode = "permissive"  # permissive | strict
backend = "in_memory"      # in_memory | sharded
shard_count = 16

[pipeline]
workers = 0         # 0 applies events on the reading thread
queue_depth = 4096  # per-worker ring capacity, power of two

[logging]
level = "info"  # trace | debug | info | warn | error | critical | off
)";
}

}  // namespace config
}  // namespace payengine
