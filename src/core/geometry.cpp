#include <roomtrace/core/geometry.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace roomtrace::core {

namespace {

// Signed shoelace sum (2 * area); positive for counter-clockwise in a
// y-up frame.
double signed_double_area(std::span<const Point> polygon) noexcept {
  const std::size_t n = polygon.size();
  if (n < 3) return 0.0;
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Point& a = polygon[i];
    const Point& b = polygon[(i + 1) % n];
    sum += a.x * b.y - b.x * a.y;
  }
  return sum;
}

}  // namespace

BoundingBox bounding_box(std::span<const Point> polygon) noexcept {
  if (polygon.empty()) return {};
  BoundingBox box{polygon[0].x, polygon[0].y, polygon[0].x, polygon[0].y};
  for (const auto& p : polygon) {
    box.min_x = std::min(box.min_x, p.x);
    box.min_y = std::min(box.min_y, p.y);
    box.max_x = std::max(box.max_x, p.x);
    box.max_y = std::max(box.max_y, p.y);
  }
  return box;
}

double shoelace_area(std::span<const Point> polygon) noexcept {
  return std::abs(signed_double_area(polygon)) * 0.5;
}

double perimeter(std::span<const Point> polygon) noexcept {
  const std::size_t n = polygon.size();
  if (n < 2) return 0.0;
  double total = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Point& a = polygon[i];
    const Point& b = polygon[(i + 1) % n];
    total += std::hypot(b.x - a.x, b.y - a.y);
  }
  return total;
}

Point centroid(std::span<const Point> polygon) noexcept {
  const std::size_t n = polygon.size();
  if (n == 0) return {};

  const double a2 = signed_double_area(polygon);
  if (std::abs(a2) < 1e-9) {
    Point mean{};
    for (const auto& p : polygon) {
      mean.x += p.x;
      mean.y += p.y;
    }
    mean.x /= static_cast<double>(n);
    mean.y /= static_cast<double>(n);
    return mean;
  }

  double cx = 0.0;
  double cy = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Point& a = polygon[i];
    const Point& b = polygon[(i + 1) % n];
    const double cross = a.x * b.y - b.x * a.y;
    cx += (a.x + b.x) * cross;
    cy += (a.y + b.y) * cross;
  }
  return {cx / (3.0 * a2), cy / (3.0 * a2)};
}

PolygonGeometry compute_geometry(std::span<const Point> polygon) noexcept {
  PolygonGeometry g;
  g.bounding_box = bounding_box(polygon);
  g.area = shoelace_area(polygon);
  g.perimeter = perimeter(polygon);
  g.centroid = centroid(polygon);
  return g;
}

float shape_confidence(std::span<const Point> polygon,
                       const PolygonGeometry& geometry) noexcept {
  const double box_area = geometry.bounding_box.width() * geometry.bounding_box.height();
  if (box_area <= 0.0) return 0.f;

  const double rectangularity = geometry.area / box_area;
  const double extra_vertices = static_cast<double>(polygon.size()) - 4.0;
  const double vertex_score = std::max(0.0, 1.0 - extra_vertices * 0.1);
  const double confidence = rectangularity * 0.7 + std::min(1.0, vertex_score) * 0.3;
  return static_cast<float>(std::clamp(confidence, 0.0, 1.0));
}

}  // namespace roomtrace::core
