#pragma once

#include <roomtrace/vision/raw_contour.hpp>
#include <cstdint>

namespace roomtrace::vision {

/// How a candidate region enclosed by another candidate is treated.
enum class NestedDecision : std::uint8_t {
  SeparateRoom,  // e.g. a walk-in closet inside a bedroom outline
  Fixture,       // furniture or fixture outline; dropped, outer kept
};

/// Containment rule: ratio = outer_area / inner_area. A ratio above
/// `containment_ratio_threshold` means the inner region is a small fraction
/// of the outer one and is a Fixture; otherwise both are rooms. Degenerate
/// inner regions (area <= 0) are always fixtures.
[[nodiscard]] NestedDecision classify_nested(double outer_area,
                                             double inner_area,
                                             double containment_ratio_threshold) noexcept;

/// Hierarchy & area filter: selects room candidates from a traced contour set.
///
/// Candidates are hole contours with area in [min_area, max_area]. Nested
/// candidates are resolved against their nearest surviving candidate
/// ancestor with classify_nested(), shallowest first, so the outcome does not
/// depend on container iteration order. Output is sorted by contour id.
class RegionFilter {
 public:
  RegionFilter(double min_area, double max_area, double containment_ratio_threshold);

  [[nodiscard]] ContourSet filter(const ContourSet& contours) const;

  [[nodiscard]] double min_area() const noexcept { return min_area_; }
  [[nodiscard]] double max_area() const noexcept { return max_area_; }
  [[nodiscard]] double containment_ratio_threshold() const noexcept {
    return containment_ratio_threshold_;
  }

 private:
  double min_area_;
  double max_area_;
  double containment_ratio_threshold_;
};

}  // namespace roomtrace::vision
