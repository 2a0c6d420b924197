#pragma once

#include <string_view>

namespace payengine {
namespace common {

inline constexpr std::string_view kLoggerName = "payengine";

[[nodiscard]] bool is_valid_log_level(std::string_view level) noexcept;

// Installs a stderr logger as the spdlog default. SPDLOG_LEVEL in the
// environment overrides `level`.
void init_logging(std::string_view level);

}  // namespace common
}  // namespace payengine
