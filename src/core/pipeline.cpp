#include <roomtrace/core/pipeline.hpp>
#include <algorithm>
#include <chrono>

namespace roomtrace::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<RoomList, DetectError> Pipeline::run(
    const Raster& input,
    StageTimingCallback* timing_cb) {
  StageOutput current = input;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const Raster* raster = std::get_if<Raster>(&current);
    if (!raster) {
      return std::get<RoomList>(std::move(current));
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*raster);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }

    current = std::move(*result);
  }

  if (auto* rooms = std::get_if<RoomList>(&current)) {
    return std::move(*rooms);
  }
  return std::unexpected(DetectError::InvalidConfig);
}

std::expected<Raster, DetectError> Pipeline::run_prefix(const Raster& input,
                                                        std::size_t count) {
  Raster current = input;
  const std::size_t n = std::min(count, stages_.size());
  for (std::size_t i = 0; i < n; ++i) {
    auto result = stages_[i]->process(current);
    if (!result) {
      return std::unexpected(result.error());
    }
    auto* raster = std::get_if<Raster>(&*result);
    if (!raster) {
      return std::unexpected(DetectError::InvalidConfig);
    }
    current = std::move(*raster);
  }
  return current;
}

}  // namespace roomtrace::core
