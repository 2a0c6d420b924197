#include "payengine/common/logging.hpp"

#include <array>
#include <memory>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace payengine {
namespace common {

namespace {
constexpr std::array<std::string_view, 7> kLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off",
};
}  // namespace

bool is_valid_log_level(std::string_view level) noexcept {
  for (const auto candidate : kLevels) {
    if (candidate == level) {
      return true;
    }
  }
  return false;
}

void init_logging(std::string_view level) {
  auto logger = spdlog::get(std::string(kLoggerName));
  if (!logger) {
    logger = std::make_shared<spdlog::logger>(
        std::string(kLoggerName), std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    spdlog::register_logger(logger);
  }
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ %v");
  spdlog::set_level(spdlog::level::from_str(std::string(level)));
  spdlog::cfg::load_env_levels();
}

}  // namespace common
}  // namespace payengine
