#pragma once

#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/error.hpp>
#include <roomtrace/core/room.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string_view>

namespace roomtrace::vision {

/// Room-boundary detector capability: encoded image bytes + params -> rooms.
///
/// Implementations must be deterministic for identical input and safe to
/// call concurrently from independent jobs (no shared mutable state).
/// An image with no enclosed regions yields an empty list, not an error;
/// undecodable bytes yield DetectError::DecodeError.
class IRoomDetector {
 public:
  virtual ~IRoomDetector() = default;

  [[nodiscard]] virtual std::expected<roomtrace::core::RoomList, roomtrace::core::DetectError>
  detect(std::span<const std::byte> image_bytes,
         const roomtrace::core::DetectorParams& params) const = 0;

  /// Short strategy name for logs and result metadata ("contour", "fixed").
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace roomtrace::vision
