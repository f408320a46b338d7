#include <roomtrace/vision/fixed_room_detector.hpp>
#include <utility>

namespace roomtrace::vision {

FixedRoomDetector::FixedRoomDetector(roomtrace::core::RoomList rooms)
    : rooms_to_return_(std::move(rooms)) {}

void FixedRoomDetector::set_rooms(roomtrace::core::RoomList rooms) {
  std::lock_guard lock(mutex_);
  rooms_to_return_ = std::move(rooms);
  error_.reset();
}

void FixedRoomDetector::set_error(roomtrace::core::DetectError error) {
  std::lock_guard lock(mutex_);
  error_ = error;
}

void FixedRoomDetector::set_before_detect(Hook hook) {
  std::lock_guard lock(mutex_);
  before_detect_ = std::move(hook);
}

std::expected<roomtrace::core::RoomList, roomtrace::core::DetectError>
FixedRoomDetector::detect(std::span<const std::byte> image_bytes,
                          const roomtrace::core::DetectorParams& /*params*/) const {
  ++invocations_;

  Hook hook;
  {
    std::lock_guard lock(mutex_);
    hook = before_detect_;
  }
  if (hook) hook();

  if (image_bytes.empty()) {
    return std::unexpected(roomtrace::core::DetectError::InvalidImage);
  }
  std::lock_guard lock(mutex_);
  if (error_) {
    return std::unexpected(*error_);
  }
  return rooms_to_return_;
}

}  // namespace roomtrace::vision
