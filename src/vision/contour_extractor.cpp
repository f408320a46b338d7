#include <roomtrace/vision/contour_extractor.hpp>
#include "raster_cv_utils.hpp"
#include <roomtrace/core/logger.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

namespace roomtrace::vision {

ContourExtractor::ContourExtractor(std::size_t min_points, double min_perimeter)
    : min_points_(min_points), min_perimeter_(min_perimeter) {}

std::expected<ContourSet, roomtrace::core::DetectError> ContourExtractor::extract(
    const roomtrace::core::Raster& mask) const {
  using roomtrace::core::DetectError;

  if (mask.format() != roomtrace::core::PixelFormat::Mask8) {
    return std::unexpected(DetectError::InvalidImage);
  }
  auto mat = detail::raster_to_mat(mask);
  if (!mat) {
    return std::unexpected(DetectError::InvalidImage);
  }

  std::vector<std::vector<cv::Point>> contours;
  std::vector<cv::Vec4i> hierarchy;  // [next, prev, first_child, parent]
  cv::Mat work = mat->clone();
  cv::findContours(work, contours, hierarchy, cv::RETR_TREE, cv::CHAIN_APPROX_NONE);

  const std::size_t n = contours.size();
  std::vector<std::int32_t> depth(n, 0);
  for (std::size_t i = 0; i < n; ++i) {
    std::int32_t d = 0;
    for (int p = hierarchy[i][3]; p >= 0; p = hierarchy[static_cast<std::size_t>(p)][3]) {
      ++d;
    }
    depth[i] = d;
  }

  std::vector<bool> keep(n, false);
  std::vector<double> arc(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    arc[i] = cv::arcLength(contours[i], true);
    keep[i] = contours[i].size() >= min_points_ && arc[i] >= min_perimeter_;
  }

  ContourSet out;
  for (std::size_t i = 0; i < n; ++i) {
    if (!keep[i]) continue;

    int parent = hierarchy[i][3];
    while (parent >= 0 && !keep[static_cast<std::size_t>(parent)]) {
      parent = hierarchy[static_cast<std::size_t>(parent)][3];
    }

    RawContour c;
    c.id = static_cast<std::int32_t>(i);
    c.parent = parent;
    c.depth = depth[i];
    c.is_hole = depth[i] % 2 == 1;
    c.area = cv::contourArea(contours[i]);
    c.arc_length = arc[i];
    c.points = std::move(contours[i]);
    out.push_back(std::move(c));
  }

  ROOMTRACE_LOG_DEBUG("contour extractor: traced " + std::to_string(n) + ", kept " +
                      std::to_string(out.size()));
  return out;
}

}  // namespace roomtrace::vision
