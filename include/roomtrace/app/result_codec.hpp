#pragma once

#include <roomtrace/app/status_query.hpp>
#include <roomtrace/core/detection_result.hpp>
#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/room.hpp>
#include <nlohmann/json.hpp>

namespace roomtrace::app {

/// {id, polygon:[[x,y],...], boundingBox:[minX,minY,maxX,maxY], area,
///  perimeter, centroid:[x,y], confidence, lines:[{start,end}], nameHint?,
///  sourceContourId}
[[nodiscard]] nlohmann::json room_to_json(const roomtrace::core::Room& room);

[[nodiscard]] nlohmann::json params_to_json(const roomtrace::core::DetectorParams& params);

/// {jobId, roomCount, params, rooms:[...]}
[[nodiscard]] nlohmann::json result_to_json(const roomtrace::core::DetectionResult& result);

/// Polling contract: {jobId, status, attempt, roomCount?, result?, error?}.
[[nodiscard]] nlohmann::json status_to_json(const JobStatusView& view);

}  // namespace roomtrace::app
