#include <roomtrace/vision/grayscale_stage.hpp>
#include "raster_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace roomtrace::vision {

std::expected<roomtrace::core::StageOutput, roomtrace::core::DetectError>
GrayscaleStage::process(const roomtrace::core::Raster& input) {
  using namespace roomtrace::core;

  auto mat_in = detail::raster_to_mat(input);
  if (!mat_in) {
    return std::unexpected(DetectError::InvalidImage);
  }

  int code = -1;
  switch (input.format()) {
    case PixelFormat::Grayscale8:
    case PixelFormat::Mask8: {
      std::vector<std::byte> buf(input.data().begin(), input.data().end());
      return StageOutput{
          Raster(input.width(), input.height(), PixelFormat::Grayscale8, std::move(buf))};
    }
    case PixelFormat::BGR8:
      code = cv::COLOR_BGR2GRAY;
      break;
    case PixelFormat::BGRA8:
      code = cv::COLOR_BGRA2GRAY;
      break;
    case PixelFormat::Unknown:
    default:
      return std::unexpected(DetectError::InvalidImage);
  }

  cv::Mat gray;
  cv::cvtColor(*mat_in, gray, code);
  return StageOutput{detail::mat_to_raster(gray, PixelFormat::Grayscale8)};
}

}  // namespace roomtrace::vision
