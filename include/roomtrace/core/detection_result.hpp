#pragma once

#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/room.hpp>
#include <cstddef>
#include <string>

namespace roomtrace::core {

/// Rooms detected for one job. Written together with the job's Completed
/// transition and never modified afterwards.
struct DetectionResult {
  std::string job_id;
  RoomList rooms;
  /// Parameters the detector ran with, kept for traceability.
  DetectorParams params{};

  [[nodiscard]] std::size_t room_count() const noexcept { return rooms.size(); }
};

}  // namespace roomtrace::core
