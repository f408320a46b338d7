#include <roomtrace/app/trigger_runner_tbb.hpp>

#ifdef ROOMTRACE_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace roomtrace::app {

std::vector<TriggerOutcome> deliver_batch_tbb(
    IngestionTrigger& trigger,
    const std::vector<ImageNotification>& notifications) {
  const std::size_t n = notifications.size();
  std::vector<TriggerOutcome> outcomes(n, TriggerOutcome::Ignored);
  if (n == 0) return outcomes;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&trigger, &notifications, &outcomes](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          outcomes[i] = trigger.deliver(notifications[i]);
        }
      });
  return outcomes;
}

}  // namespace roomtrace::app

#endif  // ROOMTRACE_HAS_TBB
