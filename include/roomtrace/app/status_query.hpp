#pragma once

#include <roomtrace/app/job_store.hpp>
#include <roomtrace/core/detection_result.hpp>
#include <roomtrace/core/job.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string_view>

namespace roomtrace::app {

enum class QueryError {
  NotFound,
  StoreUnavailable,
};

[[nodiscard]] std::string_view to_string(QueryError error) noexcept;

/// Snapshot of one job for pollers. room_count and result are set only
/// when the job is Completed; job.error only when it is Failed.
struct JobStatusView {
  roomtrace::core::Job job;
  std::optional<std::size_t> room_count;
  std::shared_ptr<const roomtrace::core::DetectionResult> result;
};

/// Read-only view over the job store; never changes state.
class StatusQueryService {
 public:
  explicit StatusQueryService(const IJobStore& store) : store_(store) {}

  [[nodiscard]] std::expected<JobStatusView, QueryError> query(
      const roomtrace::core::JobId& id) const;

 private:
  const IJobStore& store_;
};

}  // namespace roomtrace::app
