#include "raster_cv_utils.hpp"
#include <roomtrace/core/raster.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace roomtrace::vision::detail {

namespace rc = roomtrace::core;

std::optional<cv::Mat> raster_to_mat(const rc::Raster& raster) {
  if (!raster.is_valid()) return std::nullopt;

  const int w = static_cast<int>(raster.width());
  const int h = static_cast<int>(raster.height());
  auto* data = const_cast<std::byte*>(raster.data().data());

  switch (raster.format()) {
    case rc::PixelFormat::Grayscale8:
    case rc::PixelFormat::Mask8:
      return cv::Mat(h, w, CV_8UC1, data);
    case rc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case rc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data);
    case rc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

rc::Raster mat_to_raster(const cv::Mat& mat, rc::PixelFormat format) {
  if (mat.empty()) return rc::Raster();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return rc::Raster(w, h, format, std::move(buffer));
}

}  // namespace roomtrace::vision::detail
