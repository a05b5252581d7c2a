#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string_view>

namespace portiona::core::logging {

/// Process-wide "portiona" logger (colored stdout sink), created on first use.
/// Safe to call from any thread.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// "trace", "debug", "info", "warn", "error", "critical", "off";
/// anything else maps to info.
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view level);

void set_log_level(std::string_view level);

}  // namespace portiona::core::logging
