#pragma once

#include <roomtrace/core/detector_params.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace roomtrace::app {

/// Exponential backoff for transient store failures.
struct RetryPolicy {
  std::uint32_t max_attempts{3};  // total tries, including the first
  std::chrono::milliseconds initial_backoff{10};
  double multiplier{2.0};
};

/// JobRunner settings.
struct RunnerConfig {
  std::chrono::milliseconds detection_timeout{60'000};
  RetryPolicy store_retry{};
};

/// IngestionTrigger settings.
struct TriggerConfig {
  /// Only references starting with this prefix are processed; empty = all.
  std::string key_prefix{"blueprints/"};
  RetryPolicy store_retry{};
};

/// Service configuration: detector params, runner and trigger settings.
struct ServiceConfig {
  roomtrace::core::DetectorParams detector{};
  RunnerConfig runner{};
  TriggerConfig trigger{};
};

/// Load config from a simple key=value file (one per line, '#' comments).
/// A missing file yields defaults; unknown keys are ignored. A malformed
/// value throws std::invalid_argument naming the key.
ServiceConfig load_config(const std::string& path);

/// Default config when no file is provided.
ServiceConfig default_config();

}  // namespace roomtrace::app
