#pragma once

#include <opencv2/core/types.hpp>
#include <vector>

namespace roomtrace::vision {

/// Douglas-Peucker simplification of a closed contour with a tolerance of
/// epsilon_ratio * arc length, so results are stable across resolutions.
///
/// Always returns at least 3 vertices: if the reduction collapses below 3,
/// the convex hull of the original contour is used, then its axis-aligned
/// bounding rectangle.
class PolygonSimplifier {
 public:
  explicit PolygonSimplifier(double epsilon_ratio);

  [[nodiscard]] std::vector<cv::Point> simplify(const std::vector<cv::Point>& contour) const;

  /// Tolerance in pixels that simplify() would use for this contour.
  [[nodiscard]] double epsilon_for(const std::vector<cv::Point>& contour) const;

  [[nodiscard]] double epsilon_ratio() const noexcept { return epsilon_ratio_; }

 private:
  double epsilon_ratio_;
};

}  // namespace roomtrace::vision
