#pragma once

#include <roomtrace/app/ingestion_trigger.hpp>
#include <vector>

#ifdef ROOMTRACE_HAS_TBB

namespace roomtrace::app {

/// Delivers notifications as TBB tasks.
///
/// Each notification goes through IngestionTrigger::deliver, so duplicates
/// in the batch (or racing with other deliveries) still create at most one
/// job per id. Dispatch runs on TBB worker threads; the trigger's dispatch
/// callback and everything it reaches must be thread-safe.
///
/// \return Outcomes index-aligned with \p notifications.
std::vector<TriggerOutcome> deliver_batch_tbb(
    IngestionTrigger& trigger,
    const std::vector<ImageNotification>& notifications);

}  // namespace roomtrace::app

#endif  // ROOMTRACE_HAS_TBB
