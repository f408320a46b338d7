#pragma once

#include <roomtrace/core/error.hpp>
#include <roomtrace/core/pipeline_stage.hpp>
#include <roomtrace/core/raster.hpp>
#include <roomtrace/core/room.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace roomtrace::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes the Raster through until a stage returns a RoomList.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run all stages on one raster; returns the RoomList or the first error.
  /// A pipeline that never produces a RoomList yields DetectError::InvalidConfig.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  [[nodiscard]] std::expected<RoomList, DetectError> run(
      const Raster& input,
      StageTimingCallback* timing_cb = nullptr);

  /// Run only the first `count` stages, which must all emit rasters
  /// (e.g. to inspect the binary mask). InvalidConfig if one emits rooms.
  [[nodiscard]] std::expected<Raster, DetectError> run_prefix(
      const Raster& input, std::size_t count);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace roomtrace::core
