#ifdef ROOMTRACE_HAS_TBB

#include <roomtrace/app/in_memory_job_store.hpp>
#include <roomtrace/app/ingestion_trigger.hpp>
#include <roomtrace/app/job_state_machine.hpp>
#include <roomtrace/app/trigger_runner_tbb.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

namespace ra = roomtrace::app;
namespace rc = roomtrace::core;

TEST(TriggerRunnerTbbTest, ConcurrentDuplicatesDispatchOnce) {
  ra::InMemoryJobStore store;
  ra::JobStateMachine jobs(store);
  std::atomic<int> begun{0};
  ra::IngestionTrigger trigger(jobs, {}, [&](const rc::JobId& id) {
    if (jobs.begin(id).has_value()) ++begun;
  });

  std::vector<ra::ImageNotification> notes(64, {"blueprints/job_same.png", std::nullopt});
  notes.push_back({"blueprints/job_other.png", std::nullopt});
  const auto outcomes = ra::deliver_batch_tbb(trigger, notes);

  ASSERT_EQ(outcomes.size(), notes.size());
  EXPECT_EQ(std::count(outcomes.begin(), outcomes.end(), ra::TriggerOutcome::Started), 2);
  EXPECT_EQ(std::count(outcomes.begin(), outcomes.end(), ra::TriggerOutcome::Duplicate) +
                std::count(outcomes.begin(), outcomes.end(), ra::TriggerOutcome::Redispatched),
            63);
  EXPECT_EQ(begun.load(), 2);
}

TEST(TriggerRunnerTbbTest, EmptyBatch) {
  ra::InMemoryJobStore store;
  ra::JobStateMachine jobs(store);
  ra::IngestionTrigger trigger(jobs, {}, nullptr);
  EXPECT_TRUE(ra::deliver_batch_tbb(trigger, {}).empty());
}

#endif  // ROOMTRACE_HAS_TBB
