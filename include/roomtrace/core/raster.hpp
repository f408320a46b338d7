#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace roomtrace::core {

/// Memory: Raster owns a single contiguous, row-major buffer
/// (std::vector<std::byte>) with no row padding; move semantics and RAII
/// throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Raster instances are independent.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,
  BGRA8,
  Mask8,  // binary, 255 = wall/boundary, 0 = free space
};

/// Decoded blueprint image or intermediate mask in source pixel space.
class Raster {
 public:
  Raster() = default;

  Raster(std::uint32_t width,
         std::uint32_t height,
         PixelFormat format,
         std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Number of interleaved channels for the format (0 for Unknown).
  [[nodiscard]] static std::uint32_t channels(PixelFormat format) noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  /// True when dimensions are non-zero and the buffer holds a full image.
  [[nodiscard]] bool is_valid() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace roomtrace::core
