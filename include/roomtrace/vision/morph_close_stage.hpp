#pragma once

#include <roomtrace/core/error.hpp>
#include <roomtrace/core/pipeline_stage.hpp>
#include <roomtrace/core/raster.hpp>
#include <expected>

namespace roomtrace::vision {

/// Morphological closing on a Mask8 with a square kernel. Bridges gaps in
/// wall lines narrower than the kernel. kernel_size <= 1 passes through.
class MorphCloseStage : public roomtrace::core::IPipelineStage {
 public:
  explicit MorphCloseStage(int kernel_size, int iterations = 1);

  [[nodiscard]] std::expected<roomtrace::core::StageOutput,
                              roomtrace::core::DetectError>
  process(const roomtrace::core::Raster& input) override;

 private:
  int kernel_size_;
  int iterations_;
};

}  // namespace roomtrace::vision
