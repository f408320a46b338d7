#include <roomtrace/vision/binarize_stage.hpp>
#include "raster_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace roomtrace::vision {

BinarizeStage::BinarizeStage(roomtrace::core::ThresholdMode mode,
                             int threshold,
                             int adaptive_block_size,
                             double adaptive_c,
                             int blur_kernel_size)
    : mode_(mode),
      threshold_(threshold),
      adaptive_block_size_(adaptive_block_size),
      adaptive_c_(adaptive_c),
      blur_kernel_size_(blur_kernel_size) {}

std::expected<roomtrace::core::StageOutput, roomtrace::core::DetectError>
BinarizeStage::process(const roomtrace::core::Raster& input) {
  using namespace roomtrace::core;

  if (input.format() != PixelFormat::Grayscale8) {
    return std::unexpected(DetectError::InvalidImage);
  }
  auto gray = detail::raster_to_mat(input);
  if (!gray) {
    return std::unexpected(DetectError::InvalidImage);
  }

  double min_val = 0.0;
  double max_val = 0.0;
  cv::minMaxLoc(*gray, &min_val, &max_val);
  if (min_val == max_val) {
    cv::Mat empty = cv::Mat::zeros(gray->size(), CV_8UC1);
    return StageOutput{detail::mat_to_raster(empty, PixelFormat::Mask8)};
  }

  cv::Mat src = *gray;
  cv::Mat blurred;
  if (blur_kernel_size_ >= 3) {
    cv::GaussianBlur(*gray, blurred, cv::Size(blur_kernel_size_, blur_kernel_size_), 0);
    src = blurred;
  }

  cv::Mat mask;
  switch (mode_) {
    case ThresholdMode::Otsu:
      cv::threshold(src, mask, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
      break;
    case ThresholdMode::Adaptive:
      cv::adaptiveThreshold(src, mask, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                            cv::THRESH_BINARY_INV, adaptive_block_size_, adaptive_c_);
      break;
    case ThresholdMode::Fixed:
    default:
      cv::threshold(src, mask, threshold_, 255, cv::THRESH_BINARY_INV);
      break;
  }

  return StageOutput{detail::mat_to_raster(mask, PixelFormat::Mask8)};
}

}  // namespace roomtrace::vision
