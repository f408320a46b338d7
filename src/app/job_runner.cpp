#include <roomtrace/app/job_runner.hpp>
#include <roomtrace/app/retry.hpp>
#include <roomtrace/core/detection_result.hpp>
#include <roomtrace/core/logger.hpp>
#include <chrono>
#include <string>
#include <utility>

namespace roomtrace::app {

namespace rc = roomtrace::core;

std::string_view to_string(RunOutcome outcome) noexcept {
  switch (outcome) {
    case RunOutcome::Completed:
      return "completed";
    case RunOutcome::Failed:
      return "failed";
    case RunOutcome::Superseded:
      return "superseded";
    case RunOutcome::StoreUnavailable:
      return "store unavailable";
  }
  return "unknown";
}

rc::FailureKind failure_kind_for(rc::DetectError error) noexcept {
  switch (error) {
    case rc::DetectError::DecodeError:
    case rc::DetectError::InvalidImage:
      return rc::FailureKind::DecodeError;
    default:
      return rc::FailureKind::DetectorError;
  }
}

namespace {

RunOutcome outcome_for(TransitionError error) {
  return error == TransitionError::StoreUnavailable ? RunOutcome::StoreUnavailable
                                                    : RunOutcome::Superseded;
}

}  // namespace

JobRunner::JobRunner(JobStateMachine& jobs,
                     const IImageSource& images,
                     const roomtrace::vision::IRoomDetector& detector,
                     rc::DetectorParams params,
                     RunnerConfig config)
    : jobs_(jobs),
      images_(images),
      detector_(detector),
      params_(std::move(params)),
      config_(std::move(config)) {}

RunOutcome JobRunner::finish_failed(const rc::Job& job, rc::JobFailure failure) {
  ROOMTRACE_LOG_WARN("job " + job.id + ": " + std::string(rc::to_string(failure.kind)) + ": " +
                     failure.summary);
  auto failed = retry_transient(config_.store_retry, "fail " + job.id, [&] {
    return jobs_.fail(job.id, job.attempt, failure);
  });
  if (!failed) {
    ROOMTRACE_LOG_WARN("job " + job.id + ": failure not recorded (" +
                       std::string(to_string(failed.error())) + ")");
    return outcome_for(failed.error());
  }
  return RunOutcome::Failed;
}

RunOutcome JobRunner::run(const rc::JobId& id) {
  auto started = retry_transient(config_.store_retry, "begin " + id, [&] {
    return jobs_.begin(id);
  });
  if (!started) {
    ROOMTRACE_LOG_INFO("job " + id + ": not started (" +
                       std::string(to_string(started.error())) + ")");
    return outcome_for(started.error());
  }
  const rc::Job& job = *started;

  auto bytes = images_.fetch(job.image_ref);
  if (!bytes) {
    return finish_failed(job, rc::JobFailure{rc::FailureKind::FetchError,
                                             std::string(to_string(bytes.error())) + ": " +
                                                 job.image_ref});
  }

  const auto t0 = std::chrono::steady_clock::now();
  auto rooms = detector_.detect(*bytes, params_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - t0);

  // A detector error is reported as such even when it arrived late; only a
  // late success becomes a timeout.
  if (!rooms) {
    return finish_failed(job, rc::JobFailure{failure_kind_for(rooms.error()),
                                             std::string(rc::to_string(rooms.error()))});
  }
  if (elapsed > config_.detection_timeout) {
    return finish_failed(job, rc::JobFailure{rc::FailureKind::Timeout,
                                             "detection took " +
                                                 std::to_string(elapsed.count()) + " ms (limit " +
                                                 std::to_string(config_.detection_timeout.count()) +
                                                 " ms)"});
  }

  ROOMTRACE_LOG_INFO("job " + id + ": " + std::string(detector_.name()) + " detector found " +
                     std::to_string(rooms->size()) + " room(s) in " +
                     std::to_string(elapsed.count()) + " ms");

  rc::DetectionResult result;
  result.job_id = id;
  result.rooms = std::move(*rooms);
  result.params = params_;
  auto completed = retry_transient(config_.store_retry, "complete " + id, [&] {
    return jobs_.complete(id, job.attempt, result);
  });
  if (!completed) {
    ROOMTRACE_LOG_WARN("job " + id + ": result discarded (" +
                       std::string(to_string(completed.error())) + ")");
    return outcome_for(completed.error());
  }
  return RunOutcome::Completed;
}

}  // namespace roomtrace::app
