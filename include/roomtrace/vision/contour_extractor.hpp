#pragma once

#include <roomtrace/core/error.hpp>
#include <roomtrace/core/raster.hpp>
#include <roomtrace/vision/raw_contour.hpp>
#include <cstddef>
#include <expected>

namespace roomtrace::vision {

/// Traces every boundary of a Mask8 with its full parent/child topology.
///
/// Even depths are outer boundaries of wall components; odd depths are the
/// boundaries of regions those walls enclose (is_hole). Contours with fewer
/// than min_points points or an arc length below min_perimeter are dropped as
/// scan noise, and the survivors' parent links skip over dropped contours.
class ContourExtractor {
 public:
  ContourExtractor(std::size_t min_points, double min_perimeter);

  [[nodiscard]] std::expected<ContourSet, roomtrace::core::DetectError> extract(
      const roomtrace::core::Raster& mask) const;

 private:
  std::size_t min_points_;
  double min_perimeter_;
};

}  // namespace roomtrace::vision
