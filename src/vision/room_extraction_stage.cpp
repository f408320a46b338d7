#include <roomtrace/vision/room_extraction_stage.hpp>
#include <roomtrace/core/logger.hpp>
#include <roomtrace/core/room.hpp>
#include <algorithm>
#include <cstdio>
#include <vector>

namespace roomtrace::vision {

namespace rc = roomtrace::core;

std::optional<std::string> name_hint_for(const rc::PolygonGeometry& geometry,
                                         double closet_max_area_px,
                                         double hallway_min_elongation) {
  if (closet_max_area_px > 0.0 && geometry.area <= closet_max_area_px) {
    return "closet";
  }
  const double w = geometry.bounding_box.width();
  const double h = geometry.bounding_box.height();
  const double short_side = std::min(w, h);
  if (hallway_min_elongation > 0.0 && short_side > 0.0 &&
      std::max(w, h) / short_side >= hallway_min_elongation) {
    return "hallway";
  }
  return std::nullopt;
}

RoomExtractionStage::RoomExtractionStage(const rc::DetectorParams& params)
    : extractor_(params.min_contour_points, params.min_contour_perimeter),
      filter_(params.min_area_px, params.max_area_px, params.containment_ratio_threshold),
      simplifier_(params.simplify_epsilon_ratio),
      closet_max_area_px_(params.closet_max_area_px),
      hallway_min_elongation_(params.hallway_min_elongation) {}

std::expected<rc::StageOutput, rc::DetectError> RoomExtractionStage::process(
    const rc::Raster& input) {
  auto contours = extractor_.extract(input);
  if (!contours) {
    return std::unexpected(contours.error());
  }

  const ContourSet candidates = filter_.filter(*contours);

  rc::RoomList rooms;
  rooms.reserve(candidates.size());
  for (const auto& contour : candidates) {
    const std::vector<cv::Point> simplified = simplifier_.simplify(contour.points);

    rc::Room room;
    room.polygon.reserve(simplified.size());
    for (const auto& p : simplified) {
      room.polygon.push_back({static_cast<double>(p.x), static_cast<double>(p.y)});
    }

    const rc::PolygonGeometry g = rc::compute_geometry(room.polygon);
    if (g.area <= 0.0 || g.area < filter_.min_area() || g.area > filter_.max_area()) {
      ROOMTRACE_LOG_DEBUG("room extraction: dropped contour " + std::to_string(contour.id) +
                          " after simplification (area " + std::to_string(g.area) + ")");
      continue;
    }

    room.bounding_box = g.bounding_box;
    room.area = g.area;
    room.perimeter = g.perimeter;
    room.centroid = g.centroid;
    room.confidence = rc::shape_confidence(room.polygon, g);
    room.name_hint = name_hint_for(g, closet_max_area_px_, hallway_min_elongation_);
    room.source_contour_id = contour.id;
    rooms.push_back(std::move(room));
  }

  std::sort(rooms.begin(), rooms.end(), [](const rc::Room& a, const rc::Room& b) {
    if (a.bounding_box.min_y != b.bounding_box.min_y) {
      return a.bounding_box.min_y < b.bounding_box.min_y;
    }
    if (a.bounding_box.min_x != b.bounding_box.min_x) {
      return a.bounding_box.min_x < b.bounding_box.min_x;
    }
    return a.source_contour_id < b.source_contour_id;
  });

  for (std::size_t i = 0; i < rooms.size(); ++i) {
    char id[16];
    std::snprintf(id, sizeof(id), "room_%03zu", i + 1);
    rooms[i].id = id;
  }

  return rc::StageOutput{std::move(rooms)};
}

}  // namespace roomtrace::vision
