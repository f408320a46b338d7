#pragma once

#include <roomtrace/core/room.hpp>
#include <span>

namespace roomtrace::core {

/// Derived geometry of a closed polygon, in the polygon's own coordinates.
struct PolygonGeometry {
  BoundingBox bounding_box{};
  double area{0.0};
  double perimeter{0.0};
  Point centroid{};
};

/// Min/max over the vertices. Empty input yields a zero box.
[[nodiscard]] BoundingBox bounding_box(std::span<const Point> polygon) noexcept;

/// Shoelace area, absolute value (winding-order independent).
[[nodiscard]] double shoelace_area(std::span<const Point> polygon) noexcept;

/// Sum of edge lengths including the closing edge.
[[nodiscard]] double perimeter(std::span<const Point> polygon) noexcept;

/// Area-weighted centroid; falls back to the vertex mean when the polygon
/// is degenerate.
[[nodiscard]] Point centroid(std::span<const Point> polygon) noexcept;

[[nodiscard]] PolygonGeometry compute_geometry(std::span<const Point> polygon) noexcept;

/// Rectangularity heuristic in [0, 1]:
/// 0.7 * area / bbox_area + 0.3 * max(0, 1 - 0.1 * (vertices - 4)).
[[nodiscard]] float shape_confidence(std::span<const Point> polygon,
                                     const PolygonGeometry& geometry) noexcept;

}  // namespace roomtrace::core
