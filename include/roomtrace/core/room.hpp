#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roomtrace::core {

/// 2D point in source-image pixel coordinates.
struct Point {
  double x{0.0};
  double y{0.0};

  friend bool operator==(const Point&, const Point&) = default;
};

/// Axis-aligned bounding box (pixel coords, inclusive).
struct BoundingBox {
  double min_x{0.0};
  double min_y{0.0};
  double max_x{0.0};
  double max_y{0.0};

  [[nodiscard]] double width() const noexcept { return max_x - min_x; }
  [[nodiscard]] double height() const noexcept { return max_y - min_y; }
  [[nodiscard]] bool contains(const Point& p) const noexcept {
    return p.x >= min_x && p.x <= max_x && p.y >= min_y && p.y <= max_y;
  }

  friend bool operator==(const BoundingBox&, const BoundingBox&) = default;
};

/// Single detected room: simplified polygon plus derived geometry.
struct Room {
  std::string id;  // "room_001", unique within a job
  std::vector<Point> polygon;
  BoundingBox bounding_box{};
  double area{0.0};       // px^2
  double perimeter{0.0};  // px
  Point centroid{};
  float confidence{0.f};
  std::optional<std::string> name_hint;
  std::int32_t source_contour_id{-1};  // index of the traced contour

  friend bool operator==(const Room&, const Room&) = default;
};

using RoomList = std::vector<Room>;

}  // namespace roomtrace::core
