#include <roomtrace/app/in_memory_job_store.hpp>
#include <roomtrace/app/job_state_machine.hpp>
#include <roomtrace/app/status_query.hpp>
#include <gtest/gtest.h>

namespace ra = roomtrace::app;
namespace rc = roomtrace::core;

TEST(StatusQuery, UnknownJobIsNotFound) {
  ra::InMemoryJobStore store;
  const ra::StatusQueryService status(store);
  auto view = status.query("missing");
  ASSERT_FALSE(view.has_value());
  EXPECT_EQ(view.error(), ra::QueryError::NotFound);
}

TEST(StatusQuery, QueuedJobHasNoResult) {
  ra::InMemoryJobStore store;
  ra::JobStateMachine jobs(store);
  ASSERT_TRUE(jobs.enqueue("job_1", "ref").value());
  const ra::StatusQueryService status(store);
  auto view = status.query("job_1");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->job.state, rc::JobState::Queued);
  EXPECT_FALSE(view->room_count.has_value());
  EXPECT_EQ(view->result, nullptr);
}

TEST(StatusQuery, CompletedJobCarriesResult) {
  ra::InMemoryJobStore store;
  ra::JobStateMachine jobs(store);
  ASSERT_TRUE(jobs.enqueue("job_1", "ref").value());
  const auto job = jobs.begin("job_1").value();
  rc::DetectionResult result;
  result.rooms.resize(3);
  ASSERT_TRUE(jobs.complete("job_1", job.attempt, result).has_value());

  const ra::StatusQueryService status(store);
  auto view = status.query("job_1");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->job.state, rc::JobState::Completed);
  ASSERT_TRUE(view->room_count.has_value());
  EXPECT_EQ(*view->room_count, 3u);
  ASSERT_NE(view->result, nullptr);
}

TEST(StatusQuery, FailedJobCarriesError) {
  ra::InMemoryJobStore store;
  ra::JobStateMachine jobs(store);
  ASSERT_TRUE(jobs.enqueue("job_1", "ref").value());
  const auto job = jobs.begin("job_1").value();
  ASSERT_TRUE(jobs.fail("job_1", job.attempt, {rc::FailureKind::DecodeError, "bad"}).has_value());

  const ra::StatusQueryService status(store);
  auto view = status.query("job_1");
  ASSERT_TRUE(view.has_value());
  EXPECT_EQ(view->job.state, rc::JobState::Failed);
  ASSERT_TRUE(view->job.error.has_value());
  EXPECT_FALSE(view->room_count.has_value());
}

TEST(StatusQuery, QueryDoesNotChangeState) {
  ra::InMemoryJobStore store;
  ra::JobStateMachine jobs(store);
  ASSERT_TRUE(jobs.enqueue("job_1", "ref").value());
  const ra::StatusQueryService status(store);
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(status.query("job_1").has_value());
  }
  EXPECT_EQ(store.load("job_1").value().value().job.updated_at,
            store.load("job_1").value().value().job.created_at);
}

TEST(StatusQuery, StoreOutage) {
  ra::InMemoryJobStore store;
  store.fail_next(1);
  const ra::StatusQueryService status(store);
  auto view = status.query("job_1");
  ASSERT_FALSE(view.has_value());
  EXPECT_EQ(view.error(), ra::QueryError::StoreUnavailable);
}
