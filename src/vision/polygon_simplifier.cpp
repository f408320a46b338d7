#include <roomtrace/vision/polygon_simplifier.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace roomtrace::vision {

namespace {

std::vector<cv::Point> rect_corners(const std::vector<cv::Point>& contour) {
  if (contour.empty()) {
    return {cv::Point(0, 0), cv::Point(0, 0), cv::Point(0, 0), cv::Point(0, 0)};
  }
  const cv::Rect r = cv::boundingRect(contour);
  const int x1 = r.x + std::max(r.width - 1, 0);
  const int y1 = r.y + std::max(r.height - 1, 0);
  return {cv::Point(r.x, r.y), cv::Point(x1, r.y), cv::Point(x1, y1), cv::Point(r.x, y1)};
}

}  // namespace

PolygonSimplifier::PolygonSimplifier(double epsilon_ratio)
    : epsilon_ratio_(std::max(0.0, epsilon_ratio)) {}

double PolygonSimplifier::epsilon_for(const std::vector<cv::Point>& contour) const {
  if (contour.size() < 2) return 0.0;
  return epsilon_ratio_ * cv::arcLength(contour, true);
}

std::vector<cv::Point> PolygonSimplifier::simplify(
    const std::vector<cv::Point>& contour) const {
  if (contour.size() >= 3) {
    std::vector<cv::Point> approx;
    cv::approxPolyDP(contour, approx, epsilon_for(contour), true);
    if (approx.size() >= 3) {
      return approx;
    }

    std::vector<cv::Point> hull;
    cv::convexHull(contour, hull);
    if (hull.size() >= 3) {
      return hull;
    }
  }
  return rect_corners(contour);
}

}  // namespace roomtrace::vision
