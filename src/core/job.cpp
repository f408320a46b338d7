#include <roomtrace/core/job.hpp>

namespace roomtrace::core {

bool is_terminal(JobState state) noexcept {
  return state == JobState::Completed || state == JobState::Failed;
}

bool can_transition(JobState from, JobState to) noexcept {
  switch (from) {
    case JobState::Queued:
      return to == JobState::Processing;
    case JobState::Processing:
      return to == JobState::Completed || to == JobState::Failed;
    case JobState::Completed:
    case JobState::Failed:
    default:
      return false;
  }
}

std::string_view to_string(JobState state) noexcept {
  switch (state) {
    case JobState::Queued:
      return "queued";
    case JobState::Processing:
      return "processing";
    case JobState::Completed:
      return "completed";
    case JobState::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

std::string_view to_string(FailureKind kind) noexcept {
  switch (kind) {
    case FailureKind::DecodeError:
      return "DecodeError";
    case FailureKind::Timeout:
      return "TimeoutError";
    case FailureKind::FetchError:
      return "FetchError";
    case FailureKind::DetectorError:
      return "DetectorError";
    default:
      return "Unknown";
  }
}

}  // namespace roomtrace::core
