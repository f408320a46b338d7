#include <roomtrace/app/result_codec.hpp>
#include <cstddef>
#include <string>

namespace roomtrace::app {

namespace rc = roomtrace::core;

namespace {

nlohmann::json point_to_json(const rc::Point& p) {
  return nlohmann::json::array({p.x, p.y});
}

}  // namespace

nlohmann::json room_to_json(const rc::Room& room) {
  nlohmann::json polygon = nlohmann::json::array();
  nlohmann::json lines = nlohmann::json::array();
  const std::size_t n = room.polygon.size();
  for (std::size_t i = 0; i < n; ++i) {
    polygon.push_back(point_to_json(room.polygon[i]));
    lines.push_back({{"start", point_to_json(room.polygon[i])},
                     {"end", point_to_json(room.polygon[(i + 1) % n])}});
  }

  const auto& bb = room.bounding_box;
  nlohmann::json j = {
      {"id", room.id},
      {"polygon", std::move(polygon)},
      {"boundingBox", {bb.min_x, bb.min_y, bb.max_x, bb.max_y}},
      {"area", room.area},
      {"perimeter", room.perimeter},
      {"centroid", point_to_json(room.centroid)},
      {"confidence", room.confidence},
      {"lines", std::move(lines)},
      {"sourceContourId", room.source_contour_id},
  };
  if (room.name_hint) j["nameHint"] = *room.name_hint;
  return j;
}

nlohmann::json params_to_json(const rc::DetectorParams& params) {
  return {
      {"minAreaPx", params.min_area_px},
      {"maxAreaPx", params.max_area_px},
      {"simplifyEpsilonRatio", params.simplify_epsilon_ratio},
      {"containmentRatioThreshold", params.containment_ratio_threshold},
      {"morphKernelSize", params.morph_kernel_size},
      {"morphIterations", params.morph_iterations},
      {"thresholdMode", std::string(rc::to_string(params.threshold_mode))},
      {"binaryThreshold", params.binary_threshold},
      {"adaptiveBlockSize", params.adaptive_block_size},
      {"adaptiveC", params.adaptive_c},
      {"blurKernelSize", params.blur_kernel_size},
      {"minContourPoints", params.min_contour_points},
      {"minContourPerimeter", params.min_contour_perimeter},
  };
}

nlohmann::json result_to_json(const rc::DetectionResult& result) {
  nlohmann::json rooms = nlohmann::json::array();
  for (const auto& room : result.rooms) {
    rooms.push_back(room_to_json(room));
  }
  return {
      {"jobId", result.job_id},
      {"roomCount", result.room_count()},
      {"params", params_to_json(result.params)},
      {"rooms", std::move(rooms)},
  };
}

nlohmann::json status_to_json(const JobStatusView& view) {
  nlohmann::json j = {
      {"jobId", view.job.id},
      {"status", std::string(rc::to_string(view.job.state))},
      {"attempt", view.job.attempt},
  };
  if (view.room_count) j["roomCount"] = *view.room_count;
  if (view.result) j["result"] = result_to_json(*view.result);
  if (view.job.error) {
    j["error"] = {
        {"kind", std::string(rc::to_string(view.job.error->kind))},
        {"message", view.job.error->summary},
    };
  }
  return j;
}

}  // namespace roomtrace::app
