#pragma once

#include <roomtrace/core/error.hpp>
#include <roomtrace/core/room.hpp>
#include <roomtrace/vision/room_detector.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace roomtrace::vision {

/// Detector that returns scripted rooms (for tests/demo). Input bytes are
/// not decoded; only emptiness is checked.
class FixedRoomDetector : public IRoomDetector {
 public:
  /// Invoked at the start of every detect() call, e.g. to simulate a slow
  /// detector or to synchronise with a test.
  using Hook = std::function<void()>;

  FixedRoomDetector() = default;
  explicit FixedRoomDetector(roomtrace::core::RoomList rooms);

  /// Set rooms to return on subsequent detect() calls; clears any scripted error.
  void set_rooms(roomtrace::core::RoomList rooms);

  /// Make subsequent detect() calls fail with error.
  void set_error(roomtrace::core::DetectError error);

  void set_before_detect(Hook hook);

  [[nodiscard]] std::expected<roomtrace::core::RoomList, roomtrace::core::DetectError>
  detect(std::span<const std::byte> image_bytes,
         const roomtrace::core::DetectorParams& params) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "fixed"; }

  /// Number of detect() calls so far.
  [[nodiscard]] std::size_t invocations() const noexcept {
    return invocations_.load();
  }

 private:
  mutable std::mutex mutex_;
  roomtrace::core::RoomList rooms_to_return_;
  std::optional<roomtrace::core::DetectError> error_;
  Hook before_detect_;
  mutable std::atomic<std::size_t> invocations_{0};
};

}  // namespace roomtrace::vision
