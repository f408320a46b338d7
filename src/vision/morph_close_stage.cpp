#include <roomtrace/vision/morph_close_stage.hpp>
#include "raster_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <vector>

namespace roomtrace::vision {

MorphCloseStage::MorphCloseStage(int kernel_size, int iterations)
    : kernel_size_(kernel_size), iterations_(std::max(1, iterations)) {}

std::expected<roomtrace::core::StageOutput, roomtrace::core::DetectError>
MorphCloseStage::process(const roomtrace::core::Raster& input) {
  using namespace roomtrace::core;

  if (input.format() != PixelFormat::Mask8) {
    return std::unexpected(DetectError::InvalidImage);
  }
  auto mat_in = detail::raster_to_mat(input);
  if (!mat_in) {
    return std::unexpected(DetectError::InvalidImage);
  }

  if (kernel_size_ <= 1) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{
        Raster(input.width(), input.height(), PixelFormat::Mask8, std::move(buf))};
  }

  const cv::Mat kernel =
      cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kernel_size_, kernel_size_));
  cv::Mat closed;
  cv::morphologyEx(*mat_in, closed, cv::MORPH_CLOSE, kernel, cv::Point(-1, -1), iterations_);
  return StageOutput{detail::mat_to_raster(closed, PixelFormat::Mask8)};
}

}  // namespace roomtrace::vision
