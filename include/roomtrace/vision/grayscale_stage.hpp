#pragma once

#include <roomtrace/core/error.hpp>
#include <roomtrace/core/pipeline_stage.hpp>
#include <roomtrace/core/raster.hpp>
#include <expected>

namespace roomtrace::vision {

/// Converts Grayscale8 / BGR8 / BGRA8 input to a Grayscale8 raster.
class GrayscaleStage : public roomtrace::core::IPipelineStage {
 public:
  GrayscaleStage() = default;

  [[nodiscard]] std::expected<roomtrace::core::StageOutput,
                              roomtrace::core::DetectError>
  process(const roomtrace::core::Raster& input) override;
};

}  // namespace roomtrace::vision
