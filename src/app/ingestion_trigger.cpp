#include <roomtrace/app/ingestion_trigger.hpp>
#include <roomtrace/app/retry.hpp>
#include <roomtrace/core/logger.hpp>
#include <string>
#include <utility>

namespace roomtrace::app {

roomtrace::core::JobId derive_job_id(std::string_view image_ref) {
  const auto slash = image_ref.find_last_of('/');
  std::string_view name =
      slash == std::string_view::npos ? image_ref : image_ref.substr(slash + 1);
  const auto dot = name.find('.');
  if (dot != std::string_view::npos) name = name.substr(0, dot);
  return roomtrace::core::JobId(name);
}

std::string_view to_string(TriggerOutcome outcome) noexcept {
  switch (outcome) {
    case TriggerOutcome::Started:
      return "started";
    case TriggerOutcome::Duplicate:
      return "duplicate";
    case TriggerOutcome::Redispatched:
      return "redispatched";
    case TriggerOutcome::Ignored:
      return "ignored";
    case TriggerOutcome::StoreUnavailable:
      return "store unavailable";
  }
  return "unknown";
}

IngestionTrigger::IngestionTrigger(JobStateMachine& jobs, TriggerConfig config,
                                   DispatchFn dispatch)
    : jobs_(jobs), config_(std::move(config)), dispatch_(std::move(dispatch)) {}

TriggerOutcome IngestionTrigger::deliver(const ImageNotification& notification) {
  const std::string& ref = notification.image_ref;
  if (!config_.key_prefix.empty() && !ref.starts_with(config_.key_prefix)) {
    ROOMTRACE_LOG_DEBUG("trigger: skipping " + ref + " (outside " + config_.key_prefix + ")");
    return TriggerOutcome::Ignored;
  }

  const roomtrace::core::JobId id = notification.job_id.value_or(derive_job_id(ref));
  if (id.empty()) {
    ROOMTRACE_LOG_WARN("trigger: no job id for " + ref);
    return TriggerOutcome::Ignored;
  }

  auto created = retry_transient(config_.store_retry, "enqueue " + id, [&] {
    return jobs_.enqueue(id, ref);
  });
  if (!created) {
    ROOMTRACE_LOG_ERROR("trigger: job " + id + " not created (" +
                        std::string(to_string(created.error())) + ")");
    return TriggerOutcome::StoreUnavailable;
  }
  if (!*created) {
    auto state = retry_transient(config_.store_retry, "load " + id, [&] {
      return jobs_.state(id);
    });
    if (!state) {
      ROOMTRACE_LOG_ERROR("trigger: job " + id + " state unknown (" +
                          std::string(to_string(state.error())) + ")");
      return state.error() == TransitionError::StoreUnavailable
                 ? TriggerOutcome::StoreUnavailable
                 : TriggerOutcome::Duplicate;
    }
    if (*state != roomtrace::core::JobState::Queued) {
      ROOMTRACE_LOG_INFO("trigger: duplicate notification for job " + id);
      return TriggerOutcome::Duplicate;
    }
    ROOMTRACE_LOG_INFO("trigger: job " + id + " still queued, dispatching again");
    if (dispatch_) dispatch_(id);
    return TriggerOutcome::Redispatched;
  }

  if (dispatch_) dispatch_(id);
  return TriggerOutcome::Started;
}

}  // namespace roomtrace::app
