#pragma once

#include <roomtrace/app/config.hpp>
#include <roomtrace/core/logger.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <thread>

namespace roomtrace::app {

/// Call fn() until it succeeds, fails with a non-transient error, or
/// policy.max_attempts tries are used up. fn must return a std::expected
/// whose error type has an is_transient() overload. Sleeps between tries
/// with exponential backoff.
template <typename Fn>
auto retry_transient(const RetryPolicy& policy, std::string_view what, Fn&& fn)
    -> decltype(fn()) {
  const std::uint32_t attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
  auto backoff = std::chrono::duration<double, std::milli>(policy.initial_backoff);
  for (std::uint32_t i = 1;; ++i) {
    auto result = fn();
    if (result || !is_transient(result.error()) || i >= attempts) {
      return result;
    }
    ROOMTRACE_LOG_WARN(std::string(what) + ": transient store failure, retry " +
                       std::to_string(i) + "/" + std::to_string(attempts - 1));
    std::this_thread::sleep_for(backoff);
    backoff *= policy.multiplier;
  }
}

}  // namespace roomtrace::app
