#pragma once

#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/error.hpp>
#include <roomtrace/core/pipeline_stage.hpp>
#include <roomtrace/core/raster.hpp>
#include <expected>

namespace roomtrace::vision {

/// Thresholds a Grayscale8 raster into a Mask8 where dark (ink) pixels
/// become 255. Optional Gaussian blur runs first. A uniform image always
/// yields an all-zero mask.
class BinarizeStage : public roomtrace::core::IPipelineStage {
 public:
  BinarizeStage(roomtrace::core::ThresholdMode mode,
                int threshold,
                int adaptive_block_size = 11,
                double adaptive_c = 2.0,
                int blur_kernel_size = 0);

  [[nodiscard]] std::expected<roomtrace::core::StageOutput,
                              roomtrace::core::DetectError>
  process(const roomtrace::core::Raster& input) override;

 private:
  roomtrace::core::ThresholdMode mode_;
  int threshold_;
  int adaptive_block_size_;
  double adaptive_c_;
  int blur_kernel_size_;
};

}  // namespace roomtrace::vision
