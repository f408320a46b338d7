#include <roomtrace/core/detector_params.hpp>
#include <cmath>

namespace roomtrace::core {

namespace {

bool is_odd_kernel(int size) noexcept { return size >= 3 && size % 2 == 1; }

}  // namespace

std::expected<void, DetectError> validate(const DetectorParams& p) {
  if (!std::isfinite(p.min_area_px) || !std::isfinite(p.max_area_px) ||
      p.min_area_px < 0.0 || p.max_area_px <= 0.0 || p.min_area_px > p.max_area_px) {
    return std::unexpected(DetectError::InvalidParams);
  }
  if (!(p.simplify_epsilon_ratio >= 0.0) || p.simplify_epsilon_ratio >= 1.0) {
    return std::unexpected(DetectError::InvalidParams);
  }
  if (!(p.containment_ratio_threshold >= 1.0)) {
    return std::unexpected(DetectError::InvalidParams);
  }
  // 0 and 1 disable closing; anything larger must be an odd kernel.
  if (p.morph_kernel_size < 0 || p.morph_iterations < 1 ||
      (p.morph_kernel_size > 1 && !is_odd_kernel(p.morph_kernel_size))) {
    return std::unexpected(DetectError::InvalidParams);
  }
  if (p.binary_threshold < 0 || p.binary_threshold > 255) {
    return std::unexpected(DetectError::InvalidParams);
  }
  if (p.threshold_mode == ThresholdMode::Adaptive && !is_odd_kernel(p.adaptive_block_size)) {
    return std::unexpected(DetectError::InvalidParams);
  }
  if (p.blur_kernel_size != 0 && !is_odd_kernel(p.blur_kernel_size)) {
    return std::unexpected(DetectError::InvalidParams);
  }
  if (p.min_contour_perimeter < 0.0 || p.closet_max_area_px < 0.0 ||
      p.hallway_min_elongation < 0.0) {
    return std::unexpected(DetectError::InvalidParams);
  }
  return {};
}

std::string_view to_string(ThresholdMode mode) noexcept {
  switch (mode) {
    case ThresholdMode::Fixed:
      return "fixed";
    case ThresholdMode::Otsu:
      return "otsu";
    case ThresholdMode::Adaptive:
      return "adaptive";
    default:
      return "unknown";
  }
}

}  // namespace roomtrace::core
