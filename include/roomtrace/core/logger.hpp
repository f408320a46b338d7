#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace roomtrace::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3,
};

/// Process-wide logger. Messages at or below the active level go to the
/// sink (stderr by default). The initial level comes from
/// ROOMTRACE_LOG_LEVEL (error|warn|info|debug), defaulting to info.
/// Thread-safe; never throws.
class Logger {
 public:
  using Sink = std::function<void(LogLevel, std::string_view)>;

  static void set_level(LogLevel level) noexcept;
  [[nodiscard]] static LogLevel level() noexcept;

  /// Replace the output sink; an empty sink restores stderr.
  static void set_sink(Sink sink);

  static void log(LogLevel level, std::string_view message) noexcept;

  static void error(std::string_view msg) noexcept { log(LogLevel::Error, msg); }
  static void warn(std::string_view msg) noexcept { log(LogLevel::Warn, msg); }
  static void info(std::string_view msg) noexcept { log(LogLevel::Info, msg); }
  static void debug(std::string_view msg) noexcept { log(LogLevel::Debug, msg); }

  [[nodiscard]] static std::string_view level_name(LogLevel level) noexcept;
};

}  // namespace roomtrace::core

#define ROOMTRACE_LOG_ERROR(msg) ::roomtrace::core::Logger::error(msg)
#define ROOMTRACE_LOG_WARN(msg) ::roomtrace::core::Logger::warn(msg)
#define ROOMTRACE_LOG_INFO(msg) ::roomtrace::core::Logger::info(msg)
#define ROOMTRACE_LOG_DEBUG(msg) ::roomtrace::core::Logger::debug(msg)
