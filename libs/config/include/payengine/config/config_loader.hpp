#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "payengine/ledger/ledger_store.hpp"

namespace payengine {
namespace config {

enum class Backend : std::uint8_t {
  kInMemory,
  kSharded,
};

struct LedgerConfig {
  ledger::ErrorMode error_mode{ledger::ErrorMode::kPermissive};
  Backend backend{Backend::kInMemory};
  std::size_t shard_count{16};
};

struct PipelineConfig {
  std::size_t workers{0};
  std::size_t queue_depth{1 << 12};
};

struct LoggingConfig {
  std::string level{"info"};
};

struct EngineConfig {
  LedgerConfig ledger;
  PipelineConfig pipeline;
  LoggingConfig logging;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace payengine
