#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace roomtrace::core {

/// Opaque job identifier, derived from the image reference.
using JobId = std::string;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// Job lifecycle: Queued -> Processing -> {Completed | Failed}.
/// Completed and Failed are terminal for the job.
enum class JobState : std::uint8_t {
  Queued,
  Processing,
  Completed,
  Failed,
};

/// Why a job ended Failed.
enum class FailureKind : std::uint8_t {
  DecodeError,    // image bytes unreadable; not retryable here
  Timeout,        // detection exceeded the budget
  FetchError,     // image reference could not be fetched
  DetectorError,  // detector rejected params or failed internally
};

struct JobFailure {
  FailureKind kind{FailureKind::DetectorError};
  std::string summary;

  friend bool operator==(const JobFailure&, const JobFailure&) = default;
};

/// One detection job. Mutated only through JobStateMachine transitions.
struct Job {
  JobId id;
  std::string image_ref;
  JobState state{JobState::Queued};
  std::uint32_t attempt{0};  // Processing episodes started
  Timestamp created_at{};
  Timestamp updated_at{};
  std::optional<Timestamp> started_at;
  std::optional<JobFailure> error;  // present only when Failed
};

[[nodiscard]] bool is_terminal(JobState state) noexcept;

/// True for the three legal edges; everything else (regression, skipping
/// Processing, self-loops) is rejected.
[[nodiscard]] bool can_transition(JobState from, JobState to) noexcept;

[[nodiscard]] std::string_view to_string(JobState state) noexcept;
[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

}  // namespace roomtrace::core
