#include <roomtrace/core/raster.hpp>
#include <cstddef>

namespace roomtrace::core {

std::uint32_t Raster::channels(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
    case PixelFormat::Mask8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Raster::min_bytes(std::uint32_t width,
                              std::uint32_t height,
                              PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channels(format);
}

bool Raster::is_valid() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) {
    return false;
  }
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

}  // namespace roomtrace::core
