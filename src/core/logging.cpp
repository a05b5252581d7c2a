#include <portiona/core/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <string>
#include <unordered_map>

namespace portiona::core::logging {

namespace {

constexpr const char* kLoggerName = "portiona";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%n] %v";

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;

void initialize() {
  if (auto existing = spdlog::get(kLoggerName)) {
    g_logger = std::move(existing);
    return;
  }
  g_logger = spdlog::stdout_color_mt(kLoggerName);
  g_logger->set_pattern(kPattern);
  g_logger->set_level(spdlog::level::info);
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::call_once(g_init_flag, initialize);
  return g_logger;
}

spdlog::level::level_enum parse_log_level(std::string_view level) {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum> kLevels = {
      {"trace", spdlog::level::trace},
      {"debug", spdlog::level::debug},
      {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},
      {"error", spdlog::level::err},
      {"critical", spdlog::level::critical},
      {"off", spdlog::level::off},
  };
  const auto it = kLevels.find(level);
  return it != kLevels.end() ? it->second : spdlog::level::info;
}

void set_log_level(std::string_view level) {
  logger()->set_level(parse_log_level(level));
}

}  // namespace portiona::core::logging
