#pragma once

#include <roomtrace/app/job_store.hpp>
#include <roomtrace/core/detection_result.hpp>
#include <roomtrace/core/job.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace roomtrace::app {

enum class TransitionError {
  NotFound,
  Superseded,        // job moved on (other attempt, or already terminal)
  StoreUnavailable,  // transient; safe to retry
};

[[nodiscard]] constexpr bool is_transient(TransitionError error) noexcept {
  return error == TransitionError::StoreUnavailable;
}

[[nodiscard]] std::string_view to_string(TransitionError error) noexcept;

/// The only writer of Job state. Every transition is a compare-and-set on
/// (state, attempt) against the store, so at most one Processing episode
/// exists per job id and results from a superseded attempt are rejected.
///
///   enqueue:  (absent)   -> Queued
///   begin:    Queued     -> Processing   (attempt + 1)
///   complete: Processing -> Completed    (result stored in the same step)
///   fail:     Processing -> Failed
class JobStateMachine {
 public:
  using ClockFn = std::function<roomtrace::core::Timestamp()>;

  /// store must outlive the state machine. An empty clock uses system_clock.
  explicit JobStateMachine(IJobStore& store, ClockFn clock = {});

  /// Create a Queued job. Returns false if the id already exists.
  [[nodiscard]] std::expected<bool, TransitionError> enqueue(
      const roomtrace::core::JobId& id, const std::string& image_ref);

  /// Current state of a job, without changing it.
  [[nodiscard]] std::expected<roomtrace::core::JobState, TransitionError> state(
      const roomtrace::core::JobId& id) const;

  /// Queued -> Processing. Returns the job as stored after the transition.
  [[nodiscard]] std::expected<roomtrace::core::Job, TransitionError> begin(
      const roomtrace::core::JobId& id);

  /// Processing(attempt) -> Completed with result.
  [[nodiscard]] std::expected<roomtrace::core::Job, TransitionError> complete(
      const roomtrace::core::JobId& id,
      std::uint32_t attempt,
      roomtrace::core::DetectionResult result);

  /// Processing(attempt) -> Failed with failure.
  [[nodiscard]] std::expected<roomtrace::core::Job, TransitionError> fail(
      const roomtrace::core::JobId& id,
      std::uint32_t attempt,
      roomtrace::core::JobFailure failure);

  /// Fail every Processing job that started more than budget ago with
  /// FailureKind::Timeout. Returns the number of jobs expired.
  [[nodiscard]] std::expected<std::size_t, TransitionError> expire_overdue(
      std::chrono::milliseconds budget);

  [[nodiscard]] roomtrace::core::Timestamp now() const;

 private:
  using Mutator = std::function<void(roomtrace::core::Job&)>;

  std::expected<roomtrace::core::Job, TransitionError> transition(
      const roomtrace::core::JobId& id,
      roomtrace::core::JobState from,
      std::uint32_t attempt,
      roomtrace::core::JobState to,
      const Mutator& mutate,
      std::shared_ptr<const roomtrace::core::DetectionResult> result);

  IJobStore& store_;
  ClockFn clock_;
};

}  // namespace roomtrace::app
