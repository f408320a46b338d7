#pragma once

#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/error.hpp>
#include <roomtrace/core/pipeline.hpp>
#include <roomtrace/core/raster.hpp>
#include <roomtrace/core/room.hpp>
#include <roomtrace/vision/room_detector.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string_view>

namespace roomtrace::vision {

/// Build the classical detection pipeline for params:
/// Grayscale -> Binarize -> MorphClose -> RoomExtraction.
/// Params are not validated here; call core::validate first.
[[nodiscard]] roomtrace::core::Pipeline build_detection_pipeline(
    const roomtrace::core::DetectorParams& params);

/// Run only the preprocessing stages and return the wall mask (Mask8).
[[nodiscard]] std::expected<roomtrace::core::Raster, roomtrace::core::DetectError>
preprocess(const roomtrace::core::Raster& raster,
           const roomtrace::core::DetectorParams& params);

/// Classical contour-topology detector. Stateless: every call builds its
/// own pipeline, so one instance may serve concurrent jobs.
class ContourRoomDetector : public IRoomDetector {
 public:
  ContourRoomDetector() = default;

  [[nodiscard]] std::expected<roomtrace::core::RoomList, roomtrace::core::DetectError>
  detect(std::span<const std::byte> image_bytes,
         const roomtrace::core::DetectorParams& params) const override;

  /// Detect on an already decoded raster. If timing_cb is non-null it
  /// receives (stage_index, duration_ms) for each stage.
  [[nodiscard]] std::expected<roomtrace::core::RoomList, roomtrace::core::DetectError>
  detect_raster(const roomtrace::core::Raster& raster,
                const roomtrace::core::DetectorParams& params,
                roomtrace::core::StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::string_view name() const noexcept override { return "contour"; }
};

}  // namespace roomtrace::vision
