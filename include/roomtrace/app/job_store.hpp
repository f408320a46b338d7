#pragma once

#include <roomtrace/core/detection_result.hpp>
#include <roomtrace/core/job.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace roomtrace::app {

/// Store failures. Unavailable is transient and may be retried.
enum class StoreError {
  Unavailable,
};

[[nodiscard]] constexpr bool is_transient(StoreError /*error*/) noexcept { return true; }

[[nodiscard]] std::string_view to_string(StoreError error) noexcept;

/// A job plus its result (non-null only when Completed).
struct JobRecord {
  roomtrace::core::Job job;
  std::shared_ptr<const roomtrace::core::DetectionResult> result;
};

/// Durable job state store. All operations are atomic per job id.
class IJobStore {
 public:
  virtual ~IJobStore() = default;

  /// Insert job unless a job with the same id exists. Returns true if inserted.
  [[nodiscard]] virtual std::expected<bool, StoreError> create_if_absent(
      const roomtrace::core::Job& job) = 0;

  /// Consistent snapshot of one job and its result; nullopt if absent.
  [[nodiscard]] virtual std::expected<std::optional<JobRecord>, StoreError> load(
      const roomtrace::core::JobId& id) const = 0;

  /// Replace the job with next (and its result) only if the stored job is
  /// still in expected_state with expected_attempt. Returns false when the
  /// job is absent or the comparison fails.
  [[nodiscard]] virtual std::expected<bool, StoreError> compare_and_set(
      const roomtrace::core::JobId& id,
      roomtrace::core::JobState expected_state,
      std::uint32_t expected_attempt,
      const roomtrace::core::Job& next,
      std::shared_ptr<const roomtrace::core::DetectionResult> result) = 0;

  /// All jobs currently in state, ordered by id.
  [[nodiscard]] virtual std::expected<std::vector<roomtrace::core::Job>, StoreError>
  list_in_state(roomtrace::core::JobState state) const = 0;
};

}  // namespace roomtrace::app
