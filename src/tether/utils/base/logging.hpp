#pragma once

#include "spdlog/spdlog.h"

#include <cstddef>
#include <exception>
#include <string_view>
#include <utility>

/**
 * @defgroup logging Logging
 * @ingroup tether-utils
 *
 * @see https://github.com/gabime/spdlog
 *
 * One lazily created `spdlog` logger, writing to stderr, reached through the macros at the
 * bottom of this file. Every line is prefixed with its source location, relative to `src/`
 * (or `testcases/`).
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * INFO("connecting to {}:{}", host, port);
 * WARN("dropping malformed frame ({} bytes)", size);
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * The format must be a string literal, so that it is checked at compile time.
 * `TRACE` and `LOG_DEBUG` compile to nothing unless `DEBUG_BUILD` is defined.
 * `FATAL` logs, flushes, and terminates.
 *
 * The level is `trace` in debug builds and `warn` otherwise. The environment variable
 * `LOG_LEVEL_OVERRIDE` replaces that, and `set_log_level` replaces both.
 */

namespace tether::logging
{
using logger_type = spdlog::logger;

logger_type& debug_logger();

/**
 * @brief Set the level of the debug logger, eg., "info", "debug", "off".
 * @return false iff `level` does not name a log level.
 */
bool set_log_level(std::string_view level);

enum class LogLevel : int { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

namespace detail
{
   template<std::size_t N> struct static_string
   {
      char str[N]{};
      constexpr static_string(const char (&s)[N])
      {
         for(std::size_t i = 0; i < N; ++i) str[i] = s[i];
      }
   };

   template<static_string s> struct format_string
   {
      static constexpr const char* string = s.str;
   };

   // Carries a literal through to spdlog as a constant expression
   template<static_string s> constexpr auto operator""_cfmt() { return format_string<s>{}; }

   // "/home/me/tether/src/tether/net/uri.cpp" => "tether/net/uri.cpp"
   constexpr std::string_view source_name(std::string_view path)
   {
      for(std::string_view root : {"/src/", "/testcases/"}) {
         const auto pos = path.rfind(root);
         if(pos != std::string_view::npos) return path.substr(pos + root.size());
      }
      return path;
   }

   template<LogLevel level, typename F, typename... Args>
   inline void log(logger_type& logger, F, Args&&... args)
   {
      if constexpr(level == LogLevel::TRACE)
         logger.trace(F::string, std::forward<Args>(args)...);
      else if constexpr(level == LogLevel::DEBUG)
         logger.debug(F::string, std::forward<Args>(args)...);
      else if constexpr(level == LogLevel::INFO)
         logger.info(F::string, std::forward<Args>(args)...);
      else if constexpr(level == LogLevel::WARN)
         logger.warn(F::string, std::forward<Args>(args)...);
      else if constexpr(level == LogLevel::ERROR)
         logger.error(F::string, std::forward<Args>(args)...);
      else {
         logger.critical(F::string, std::forward<Args>(args)...);
         logger.flush();
         std::terminate();
      }
   }
} // namespace detail

} // namespace tether::logging

// ---------------------------------------------------------------------------------------- Macros

#define TETHER_LOG_(level, fmt, ...)                                                               \
   {                                                                                               \
      using namespace ::tether::logging::detail;                                                   \
      ::tether::logging::detail::log<::tether::logging::LogLevel::level>(                          \
          ::tether::logging::debug_logger(), "[{}:{}] " fmt##_cfmt,                                \
          ::tether::logging::detail::source_name(__FILE__),                                        \
          __LINE__ __VA_OPT__(, ) __VA_ARGS__);                                                    \
   }

#ifdef DEBUG_BUILD
#define TRACE(fmt, ...) TETHER_LOG_(TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_DEBUG(fmt, ...) TETHER_LOG_(DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
#define TRACE(fmt, ...)
#define LOG_DEBUG(fmt, ...)
#endif

#define INFO(fmt, ...) TETHER_LOG_(INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define WARN(fmt, ...) TETHER_LOG_(WARN, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_ERR(fmt, ...) TETHER_LOG_(ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define FATAL(fmt, ...) TETHER_LOG_(FATAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#ifdef Expects
#undef Expects
#endif
#ifdef NDEBUG
#define Expects(condition)
#else
#define Expects(condition)                                                                         \
   if(!__builtin_expect(!!(condition), 1)) FATAL("precondition failed: {}", #condition)
#endif
