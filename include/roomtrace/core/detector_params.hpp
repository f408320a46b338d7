#pragma once

#include <roomtrace/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

namespace roomtrace::core {

/// Binarization policy for the preprocessor.
enum class ThresholdMode : std::uint8_t {
  Fixed,     // inverse threshold at binary_threshold
  Otsu,      // global threshold picked per image
  Adaptive,  // Gaussian-weighted local mean minus adaptive_c
};

/// Tunables for one detection run. Defaults are documented in DESIGN.md.
struct DetectorParams {
  // Emitted room area bounds, px^2.
  double min_area_px{1000.0};
  double max_area_px{25'000'000.0};

  // Douglas-Peucker tolerance as a fraction of the contour arc length.
  double simplify_epsilon_ratio{0.01};

  // outer.area / inner.area above which a nested region is a fixture.
  double containment_ratio_threshold{20.0};

  // Morphological closing; kernel_size <= 1 disables it.
  int morph_kernel_size{3};
  int morph_iterations{1};

  ThresholdMode threshold_mode{ThresholdMode::Fixed};
  int binary_threshold{128};
  int adaptive_block_size{11};
  double adaptive_c{2.0};
  int blur_kernel_size{0};  // odd, 0 = no blur

  // Scan-noise cut applied right after tracing.
  std::size_t min_contour_points{8};
  double min_contour_perimeter{24.0};

  // Best-effort name hints; 0 disables each rule.
  double closet_max_area_px{0.0};
  double hallway_min_elongation{0.0};
};

/// Rejects inconsistent parameter sets (min > max, non-positive ratios,
/// even kernel sizes, ...).
[[nodiscard]] std::expected<void, DetectError> validate(const DetectorParams& params);

[[nodiscard]] std::string_view to_string(ThresholdMode mode) noexcept;

}  // namespace roomtrace::core
