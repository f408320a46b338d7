#pragma once

#include <roomtrace/app/ingestion_trigger.hpp>
#include <cstddef>
#include <vector>

namespace roomtrace::app {

/// Delivers notifications one by one; outcomes are index-aligned with the input.
std::vector<TriggerOutcome> deliver_batch(IngestionTrigger& trigger,
                                          const std::vector<ImageNotification>& notifications);

/// Delivers notifications in parallel using a thread pool. Dispatch (and
/// therefore job execution) runs on the worker threads. num_workers 0 =
/// use hardware concurrency. Outcomes are index-aligned with the input.
std::vector<TriggerOutcome> deliver_batch_parallel(
    IngestionTrigger& trigger,
    const std::vector<ImageNotification>& notifications,
    std::size_t num_workers = 0);

}  // namespace roomtrace::app
