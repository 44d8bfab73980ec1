#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tether::logging {

namespace {

constexpr const char* k_level_variable = "LOG_LEVEL_OVERRIDE";

std::optional<spdlog::level::level_enum> level_from_name(std::string_view name) {
  const auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off")
    return std::nullopt;
  return level;
}

// Logs go to stderr, so that stdout stays free for whatever the session prints
std::shared_ptr<spdlog::logger> make_logger() {
  auto logger = spdlog::stderr_color_mt("tether");
  logger->set_pattern("[%Y-%m-%d %T.%e] [%^%l%$] [%t] %v");

#ifdef DEBUG_BUILD
  logger->set_level(spdlog::level::trace);
#else
  logger->set_level(spdlog::level::warn);
#endif

  if (const char* value = std::getenv(k_level_variable); value != nullptr) {
    if (const auto level = level_from_name(value))
      logger->set_level(*level);
    else
      logger->error("ignoring {}={}, not a log level", k_level_variable, value);
  }
  return logger;
}

} // namespace

/**
 * @ingroup logging
 * @brief The process wide logger, created on first use.
 */
spdlog::logger& debug_logger() {
  static std::once_flag flag;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(flag, []() { instance = make_logger(); });
  return *instance;
}

bool set_log_level(std::string_view name) {
  const auto level = level_from_name(name);
  if (!level)
    return false;
  debug_logger().set_level(*level);
  return true;
}

} // namespace tether::logging
