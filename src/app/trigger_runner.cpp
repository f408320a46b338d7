#include <roomtrace/app/trigger_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>

namespace roomtrace::app {

std::vector<TriggerOutcome> deliver_batch(IngestionTrigger& trigger,
                                          const std::vector<ImageNotification>& notifications) {
  std::vector<TriggerOutcome> outcomes;
  outcomes.reserve(notifications.size());
  for (const auto& n : notifications) {
    outcomes.push_back(trigger.deliver(n));
  }
  return outcomes;
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

std::vector<TriggerOutcome> deliver_batch_parallel(
    IngestionTrigger& trigger,
    const std::vector<ImageNotification>& notifications,
    std::size_t num_workers) {
  const std::size_t n = notifications.size();
  if (n == 0) return {};

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return deliver_batch(trigger, notifications);
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;
  std::vector<TriggerOutcome> outcomes(n, TriggerOutcome::Ignored);

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      outcomes[idx] = trigger.deliver(notifications[idx]);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return outcomes;
}

}  // namespace roomtrace::app
