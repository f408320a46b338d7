#pragma once

#include <roomtrace/core/error.hpp>
#include <roomtrace/core/raster.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace roomtrace::vision {

/// Decode encoded image bytes (PNG, JPEG, ...) into a Grayscale8 or BGR8
/// raster. Empty or unreadable input -> DetectError::DecodeError.
[[nodiscard]] std::expected<roomtrace::core::Raster, roomtrace::core::DetectError>
decode_image(std::span<const std::byte> bytes);

/// Load an image file into a Raster (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<roomtrace::core::Raster> load_raster_from_file(const std::string& path);

/// Encode a raster as PNG and write it to path. Returns false on failure.
bool write_png(const std::string& path, const roomtrace::core::Raster& raster);

}  // namespace roomtrace::vision
