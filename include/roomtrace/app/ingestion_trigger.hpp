#pragma once

#include <roomtrace/app/config.hpp>
#include <roomtrace/app/job_state_machine.hpp>
#include <roomtrace/core/job.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace roomtrace::app {

/// "An image was stored at image_ref". Delivered at least once.
struct ImageNotification {
  std::string image_ref;
  /// Overrides the id derived from image_ref when set.
  std::optional<roomtrace::core::JobId> job_id;
};

/// Job id for a reference: its file name up to the first '.'
/// ("blueprints/job_123.png" -> "job_123"). Empty if there is none.
[[nodiscard]] roomtrace::core::JobId derive_job_id(std::string_view image_ref);

enum class TriggerOutcome {
  Started,           // job created and dispatched
  Duplicate,         // job already past Queued; event dropped
  Redispatched,      // job existed but was still Queued; dispatched again
  Ignored,           // reference outside the key prefix, or no job id
  StoreUnavailable,  // retry budget exhausted
};

[[nodiscard]] std::string_view to_string(TriggerOutcome outcome) noexcept;

/// Hand-off for a freshly created job (typically JobRunner::run).
using DispatchFn = std::function<void(const roomtrace::core::JobId&)>;

/// Turns notifications into at most one job per id. Safe to call
/// concurrently; concurrent duplicates race on the store's
/// create_if_absent and exactly one of them creates the job. A redelivery
/// that finds the job still Queued dispatches it again, so a job whose
/// runner never started is picked up by the next delivery; the runner's
/// begin() compare-and-set keeps it to one Processing episode.
class IngestionTrigger {
 public:
  IngestionTrigger(JobStateMachine& jobs, TriggerConfig config, DispatchFn dispatch);

  TriggerOutcome deliver(const ImageNotification& notification);

 private:
  JobStateMachine& jobs_;
  TriggerConfig config_;
  DispatchFn dispatch_;
};

}  // namespace roomtrace::app
