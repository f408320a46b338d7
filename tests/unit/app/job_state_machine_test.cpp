#include <roomtrace/app/in_memory_job_store.hpp>
#include <roomtrace/app/job_state_machine.hpp>
#include <gtest/gtest.h>
#include <chrono>

namespace ra = roomtrace::app;
namespace rc = roomtrace::core;

namespace {

class JobStateMachineTest : public ::testing::Test {
 protected:
  JobStateMachineTest()
      : jobs_(store_, [this] { return now_; }) {}

  void advance(std::chrono::milliseconds d) { now_ += d; }

  ra::InMemoryJobStore store_;
  rc::Timestamp now_{rc::Clock::now()};
  ra::JobStateMachine jobs_;
};

}  // namespace

TEST_F(JobStateMachineTest, EnqueueCreatesQueuedJobOnce) {
  auto first = jobs_.enqueue("job_1", "blueprints/job_1.png");
  auto second = jobs_.enqueue("job_1", "blueprints/job_1.png");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(*first);
  EXPECT_FALSE(*second);

  auto rec = store_.load("job_1");
  ASSERT_TRUE(rec.has_value() && rec->has_value());
  EXPECT_EQ((*rec)->job.state, rc::JobState::Queued);
  EXPECT_EQ((*rec)->job.attempt, 0u);
  EXPECT_EQ((*rec)->job.created_at, now_);
}

TEST_F(JobStateMachineTest, BeginStartsSingleEpisode) {
  ASSERT_TRUE(jobs_.enqueue("job_1", "ref").value());
  advance(std::chrono::milliseconds(5));
  auto started = jobs_.begin("job_1");
  ASSERT_TRUE(started.has_value());
  EXPECT_EQ(started->state, rc::JobState::Processing);
  EXPECT_EQ(started->attempt, 1u);
  ASSERT_TRUE(started->started_at.has_value());
  EXPECT_EQ(*started->started_at, now_);

  auto again = jobs_.begin("job_1");
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), ra::TransitionError::Superseded);
}

TEST_F(JobStateMachineTest, BeginUnknownJob) {
  auto r = jobs_.begin("missing");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ra::TransitionError::NotFound);
}

TEST_F(JobStateMachineTest, CompleteStoresResult) {
  ASSERT_TRUE(jobs_.enqueue("job_1", "ref").value());
  const auto job = jobs_.begin("job_1").value();

  rc::DetectionResult result;
  result.rooms.resize(2);
  auto done = jobs_.complete("job_1", job.attempt, result);
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->state, rc::JobState::Completed);

  auto rec = store_.load("job_1");
  ASSERT_TRUE(rec.has_value() && rec->has_value());
  ASSERT_NE((*rec)->result, nullptr);
  EXPECT_EQ((*rec)->result->job_id, "job_1");
  EXPECT_EQ((*rec)->result->room_count(), 2u);
}

TEST_F(JobStateMachineTest, CompleteWithStaleAttemptIsSuperseded) {
  ASSERT_TRUE(jobs_.enqueue("job_1", "ref").value());
  const auto job = jobs_.begin("job_1").value();
  auto r = jobs_.complete("job_1", job.attempt + 1, rc::DetectionResult{});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ra::TransitionError::Superseded);
}

TEST_F(JobStateMachineTest, CannotSkipProcessing) {
  ASSERT_TRUE(jobs_.enqueue("job_1", "ref").value());
  auto r = jobs_.complete("job_1", 0, rc::DetectionResult{});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ra::TransitionError::Superseded);
  auto f = jobs_.fail("job_1", 0, {rc::FailureKind::DetectorError, "x"});
  ASSERT_FALSE(f.has_value());
}

TEST_F(JobStateMachineTest, FailRecordsErrorAndIsTerminal) {
  ASSERT_TRUE(jobs_.enqueue("job_1", "ref").value());
  const auto job = jobs_.begin("job_1").value();
  auto failed = jobs_.fail("job_1", job.attempt, {rc::FailureKind::DecodeError, "bad bytes"});
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->state, rc::JobState::Failed);
  ASSERT_TRUE(failed->error.has_value());
  EXPECT_EQ(failed->error->kind, rc::FailureKind::DecodeError);

  auto late = jobs_.complete("job_1", job.attempt, rc::DetectionResult{});
  ASSERT_FALSE(late.has_value());
  EXPECT_EQ(late.error(), ra::TransitionError::Superseded);
  EXPECT_FALSE(jobs_.begin("job_1").has_value());
}

TEST_F(JobStateMachineTest, ExpireOverdueFailsOnlyOldProcessingJobs) {
  ASSERT_TRUE(jobs_.enqueue("old", "ref").value());
  ASSERT_TRUE(jobs_.begin("old").has_value());
  advance(std::chrono::seconds(10));
  ASSERT_TRUE(jobs_.enqueue("fresh", "ref").value());
  ASSERT_TRUE(jobs_.begin("fresh").has_value());
  ASSERT_TRUE(jobs_.enqueue("waiting", "ref").value());
  advance(std::chrono::seconds(2));

  auto expired = jobs_.expire_overdue(std::chrono::seconds(5));
  ASSERT_TRUE(expired.has_value());
  EXPECT_EQ(*expired, 1u);

  const auto old = store_.load("old").value().value().job;
  EXPECT_EQ(old.state, rc::JobState::Failed);
  ASSERT_TRUE(old.error.has_value());
  EXPECT_EQ(old.error->kind, rc::FailureKind::Timeout);
  EXPECT_EQ(store_.load("fresh").value().value().job.state, rc::JobState::Processing);
  EXPECT_EQ(store_.load("waiting").value().value().job.state, rc::JobState::Queued);
}

TEST_F(JobStateMachineTest, StoreOutageSurfacesAsUnavailable) {
  store_.fail_next(1);
  auto r = jobs_.enqueue("job_1", "ref");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ra::TransitionError::StoreUnavailable);
  EXPECT_TRUE(ra::is_transient(r.error()));
}

TEST_F(JobStateMachineTest, StateReadsWithoutTransition) {
  EXPECT_EQ(jobs_.state("job_1").error(), ra::TransitionError::NotFound);
  ASSERT_TRUE(jobs_.enqueue("job_1", "ref").value());
  EXPECT_EQ(jobs_.state("job_1").value(), rc::JobState::Queued);
  ASSERT_TRUE(jobs_.begin("job_1").has_value());
  EXPECT_EQ(jobs_.state("job_1").value(), rc::JobState::Processing);

  store_.fail_next(1);
  EXPECT_EQ(jobs_.state("job_1").error(), ra::TransitionError::StoreUnavailable);
}
