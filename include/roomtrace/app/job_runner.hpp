#pragma once

#include <roomtrace/app/config.hpp>
#include <roomtrace/app/image_source.hpp>
#include <roomtrace/app/job_state_machine.hpp>
#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/error.hpp>
#include <roomtrace/core/job.hpp>
#include <roomtrace/vision/room_detector.hpp>
#include <string_view>

namespace roomtrace::app {

/// How one run() ended.
enum class RunOutcome {
  Completed,
  Failed,
  Superseded,        // another attempt owns the job, or it is already terminal
  StoreUnavailable,  // retry budget exhausted
};

[[nodiscard]] std::string_view to_string(RunOutcome outcome) noexcept;

/// Maps a detector error to the job failure kind it ends in.
[[nodiscard]] roomtrace::core::FailureKind failure_kind_for(
    roomtrace::core::DetectError error) noexcept;

/// Executes one job: Queued -> Processing, fetch image, detect, then
/// Completed or Failed. Detection is not interrupted; a run slower than
/// the configured timeout ends Failed/Timeout and its rooms are discarded.
/// All collaborators must outlive the runner. run() may be called from
/// several threads for different jobs.
class JobRunner {
 public:
  JobRunner(JobStateMachine& jobs,
            const IImageSource& images,
            const roomtrace::vision::IRoomDetector& detector,
            roomtrace::core::DetectorParams params,
            RunnerConfig config = {});

  RunOutcome run(const roomtrace::core::JobId& id);

 private:
  RunOutcome finish_failed(const roomtrace::core::Job& job, roomtrace::core::JobFailure failure);

  JobStateMachine& jobs_;
  const IImageSource& images_;
  const roomtrace::vision::IRoomDetector& detector_;
  roomtrace::core::DetectorParams params_;
  RunnerConfig config_;
};

}  // namespace roomtrace::app
