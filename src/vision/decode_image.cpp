#include <roomtrace/vision/decode_image.hpp>
#include "raster_cv_utils.hpp"
#include <roomtrace/core/logger.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <limits>
#include <string>

namespace roomtrace::vision {

namespace {

roomtrace::core::PixelFormat format_for(const cv::Mat& mat) {
  return mat.channels() == 1 ? roomtrace::core::PixelFormat::Grayscale8
                             : roomtrace::core::PixelFormat::BGR8;
}

}  // namespace

std::expected<roomtrace::core::Raster, roomtrace::core::DetectError> decode_image(
    std::span<const std::byte> bytes) {
  using roomtrace::core::DetectError;

  if (bytes.empty() ||
      bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::unexpected(DetectError::DecodeError);
  }

  cv::Mat decoded;
  try {
    const cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1,
                          const_cast<std::byte*>(bytes.data()));
    decoded = cv::imdecode(encoded, cv::IMREAD_ANYCOLOR);
  } catch (const cv::Exception& e) {
    ROOMTRACE_LOG_WARN(std::string("decode_image: ") + e.what());
    return std::unexpected(DetectError::DecodeError);
  }

  if (!decoded.empty() && decoded.channels() == 4) {
    cv::cvtColor(decoded, decoded, cv::COLOR_BGRA2BGR);
  }
  if (decoded.empty() || decoded.depth() != CV_8U ||
      (decoded.channels() != 1 && decoded.channels() != 3)) {
    return std::unexpected(DetectError::DecodeError);
  }
  return detail::mat_to_raster(decoded, format_for(decoded));
}

std::optional<roomtrace::core::Raster> load_raster_from_file(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_ANYCOLOR);
  if (mat.empty() || mat.depth() != CV_8U) return std::nullopt;
  return detail::mat_to_raster(mat, format_for(mat));
}

bool write_png(const std::string& path, const roomtrace::core::Raster& raster) {
  auto mat = detail::raster_to_mat(raster);
  if (!mat) return false;
  try {
    return cv::imwrite(path, *mat);
  } catch (const cv::Exception& e) {
    ROOMTRACE_LOG_WARN(std::string("write_png: ") + e.what());
    return false;
  }
}

}  // namespace roomtrace::vision
