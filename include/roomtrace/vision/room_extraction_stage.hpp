#pragma once

#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/error.hpp>
#include <roomtrace/core/geometry.hpp>
#include <roomtrace/core/pipeline_stage.hpp>
#include <roomtrace/core/raster.hpp>
#include <roomtrace/vision/contour_extractor.hpp>
#include <roomtrace/vision/polygon_simplifier.hpp>
#include <roomtrace/vision/region_filter.hpp>
#include <expected>
#include <optional>
#include <string>

namespace roomtrace::vision {

/// Best-effort room name from geometry alone: "closet" for small regions,
/// "hallway" for elongated ones, nullopt otherwise. A zero threshold
/// disables the corresponding rule.
[[nodiscard]] std::optional<std::string> name_hint_for(
    const roomtrace::core::PolygonGeometry& geometry,
    double closet_max_area_px,
    double hallway_min_elongation);

/// Final pipeline stage: Mask8 -> RoomList.
/// Traces contours, filters them, simplifies each survivor and derives its
/// geometry. Rooms whose simplified area falls outside the area bounds are
/// dropped. Output is ordered top-to-bottom, left-to-right and numbered
/// room_001, room_002, ...
class RoomExtractionStage : public roomtrace::core::IPipelineStage {
 public:
  explicit RoomExtractionStage(const roomtrace::core::DetectorParams& params);

  [[nodiscard]] std::expected<roomtrace::core::StageOutput,
                              roomtrace::core::DetectError>
  process(const roomtrace::core::Raster& input) override;

 private:
  ContourExtractor extractor_;
  RegionFilter filter_;
  PolygonSimplifier simplifier_;
  double closet_max_area_px_;
  double hallway_min_elongation_;
};

}  // namespace roomtrace::vision
