#include <roomtrace/app/status_query.hpp>

namespace roomtrace::app {

std::string_view to_string(QueryError error) noexcept {
  switch (error) {
    case QueryError::NotFound:
      return "job not found";
    case QueryError::StoreUnavailable:
      return "store unavailable";
  }
  return "unknown query error";
}

std::expected<JobStatusView, QueryError> StatusQueryService::query(
    const roomtrace::core::JobId& id) const {
  auto record = store_.load(id);
  if (!record) {
    return std::unexpected(QueryError::StoreUnavailable);
  }
  if (!record->has_value()) {
    return std::unexpected(QueryError::NotFound);
  }

  JobStatusView view;
  view.job = (*record)->job;
  if (view.job.state == roomtrace::core::JobState::Completed && (*record)->result) {
    view.result = (*record)->result;
    view.room_count = view.result->room_count();
  }
  return view;
}

}  // namespace roomtrace::app
