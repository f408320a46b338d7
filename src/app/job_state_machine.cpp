#include <roomtrace/app/job_state_machine.hpp>
#include <roomtrace/core/logger.hpp>
#include <utility>

namespace roomtrace::app {

namespace rc = roomtrace::core;

std::string_view to_string(TransitionError error) noexcept {
  switch (error) {
    case TransitionError::NotFound:
      return "job not found";
    case TransitionError::Superseded:
      return "superseded";
    case TransitionError::StoreUnavailable:
      return "store unavailable";
  }
  return "unknown transition error";
}

JobStateMachine::JobStateMachine(IJobStore& store, ClockFn clock)
    : store_(store), clock_(std::move(clock)) {}

rc::Timestamp JobStateMachine::now() const {
  return clock_ ? clock_() : rc::Clock::now();
}

std::expected<bool, TransitionError> JobStateMachine::enqueue(const rc::JobId& id,
                                                              const std::string& image_ref) {
  rc::Job job;
  job.id = id;
  job.image_ref = image_ref;
  job.state = rc::JobState::Queued;
  job.attempt = 0;
  job.created_at = now();
  job.updated_at = job.created_at;

  auto inserted = store_.create_if_absent(job);
  if (!inserted) {
    return std::unexpected(TransitionError::StoreUnavailable);
  }
  if (*inserted) {
    ROOMTRACE_LOG_INFO("job " + id + ": queued (" + image_ref + ")");
  }
  return *inserted;
}

std::expected<rc::JobState, TransitionError> JobStateMachine::state(const rc::JobId& id) const {
  auto record = store_.load(id);
  if (!record) {
    return std::unexpected(TransitionError::StoreUnavailable);
  }
  if (!record->has_value()) {
    return std::unexpected(TransitionError::NotFound);
  }
  return (*record)->job.state;
}

std::expected<rc::Job, TransitionError> JobStateMachine::transition(
    const rc::JobId& id,
    rc::JobState from,
    std::uint32_t attempt,
    rc::JobState to,
    const Mutator& mutate,
    std::shared_ptr<const rc::DetectionResult> result) {
  auto record = store_.load(id);
  if (!record) {
    return std::unexpected(TransitionError::StoreUnavailable);
  }
  if (!record->has_value()) {
    return std::unexpected(TransitionError::NotFound);
  }

  const rc::Job& current = (*record)->job;
  if (current.state != from || current.attempt != attempt || !rc::can_transition(from, to)) {
    return std::unexpected(TransitionError::Superseded);
  }

  rc::Job next = current;
  next.state = to;
  next.updated_at = now();
  if (mutate) mutate(next);

  auto swapped = store_.compare_and_set(id, from, attempt, next, std::move(result));
  if (!swapped) {
    return std::unexpected(TransitionError::StoreUnavailable);
  }
  if (!*swapped) {
    return std::unexpected(TransitionError::Superseded);
  }
  ROOMTRACE_LOG_INFO("job " + id + ": " + std::string(rc::to_string(from)) + " -> " +
                     std::string(rc::to_string(to)) + " (attempt " +
                     std::to_string(next.attempt) + ")");
  return next;
}

std::expected<rc::Job, TransitionError> JobStateMachine::begin(const rc::JobId& id) {
  auto record = store_.load(id);
  if (!record) {
    return std::unexpected(TransitionError::StoreUnavailable);
  }
  if (!record->has_value()) {
    return std::unexpected(TransitionError::NotFound);
  }
  const std::uint32_t attempt = (*record)->job.attempt;
  return transition(
      id, rc::JobState::Queued, attempt, rc::JobState::Processing,
      [](rc::Job& job) {
        job.attempt += 1;
        job.started_at = job.updated_at;
      },
      nullptr);
}

std::expected<rc::Job, TransitionError> JobStateMachine::complete(const rc::JobId& id,
                                                                  std::uint32_t attempt,
                                                                  rc::DetectionResult result) {
  result.job_id = id;
  auto stored = std::make_shared<const rc::DetectionResult>(std::move(result));
  return transition(id, rc::JobState::Processing, attempt, rc::JobState::Completed,
                    {}, std::move(stored));
}

std::expected<rc::Job, TransitionError> JobStateMachine::fail(const rc::JobId& id,
                                                              std::uint32_t attempt,
                                                              rc::JobFailure failure) {
  return transition(
      id, rc::JobState::Processing, attempt, rc::JobState::Failed,
      [&failure](rc::Job& job) { job.error = std::move(failure); },
      nullptr);
}

std::expected<std::size_t, TransitionError> JobStateMachine::expire_overdue(
    std::chrono::milliseconds budget) {
  auto processing = store_.list_in_state(rc::JobState::Processing);
  if (!processing) {
    return std::unexpected(TransitionError::StoreUnavailable);
  }

  const rc::Timestamp t = now();
  std::size_t expired = 0;
  for (const auto& job : *processing) {
    const rc::Timestamp started = job.started_at.value_or(job.updated_at);
    if (t - started <= budget) continue;

    auto failed = fail(job.id, job.attempt,
                       rc::JobFailure{rc::FailureKind::Timeout,
                                      "no result within " + std::to_string(budget.count()) + " ms"});
    if (failed) {
      ++expired;
    } else if (failed.error() == TransitionError::StoreUnavailable) {
      return std::unexpected(failed.error());
    }
  }
  return expired;
}

}  // namespace roomtrace::app
