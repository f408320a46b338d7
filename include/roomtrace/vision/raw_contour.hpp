#pragma once

#include <opencv2/core/types.hpp>
#include <cstdint>
#include <vector>

namespace roomtrace::vision {

/// Traced boundary before filtering and simplification (not persisted).
struct RawContour {
  std::int32_t id{-1};      // index in trace order; stable for a given mask
  std::int32_t parent{-1};  // id of the nearest surviving enclosing contour
  std::int32_t depth{0};    // nesting depth in the full trace hierarchy
  bool is_hole{false};      // boundary of a region enclosed by wall pixels
  std::vector<cv::Point> points;  // dense, closed chain
  double area{0.0};
  double arc_length{0.0};
};

using ContourSet = std::vector<RawContour>;

}  // namespace roomtrace::vision
