#include <roomtrace/core/logger.hpp>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace roomtrace::core {

namespace {

LogLevel parse_env_level() noexcept {
  const char* env = std::getenv("ROOMTRACE_LOG_LEVEL");
  if (!env) return LogLevel::Info;

  std::string value(env);
  for (char& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (value == "error") return LogLevel::Error;
  if (value == "warn" || value == "warning") return LogLevel::Warn;
  if (value == "debug") return LogLevel::Debug;
  return LogLevel::Info;
}

struct LoggerState {
  std::mutex mutex;
  LogLevel level{parse_env_level()};
  Logger::Sink sink;
};

LoggerState& state() {
  static LoggerState s;
  return s;
}

std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
  std::tm tm_buf{};
  localtime_r(&time, &tm_buf);
  std::ostringstream out;
  out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count();
  return out.str();
}

}  // namespace

void Logger::set_level(LogLevel level) noexcept {
  auto& s = state();
  std::lock_guard lock(s.mutex);
  s.level = level;
}

LogLevel Logger::level() noexcept {
  auto& s = state();
  std::lock_guard lock(s.mutex);
  return s.level;
}

void Logger::set_sink(Sink sink) {
  auto& s = state();
  std::lock_guard lock(s.mutex);
  s.sink = std::move(sink);
}

void Logger::log(LogLevel level, std::string_view message) noexcept {
  try {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (static_cast<std::uint8_t>(level) > static_cast<std::uint8_t>(s.level)) {
      return;
    }
    if (s.sink) {
      s.sink(level, message);
      return;
    }
    std::cerr << '[' << timestamp() << "] [" << level_name(level) << "] "
              << message << '\n';
  } catch (const std::exception&) {
    std::fputs("roomtrace: log sink failed\n", stderr);
  }
}

std::string_view Logger::level_name(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Debug:
      return "DEBUG";
    default:
      return "UNKNOWN";
  }
}

}  // namespace roomtrace::core
