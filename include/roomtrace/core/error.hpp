#pragma once

#include <string_view>

namespace roomtrace::core {

/// Detection error codes; used with std::expected for recoverable failures.
enum class DetectError {
  None = 0,
  InvalidImage,
  DecodeError,
  InvalidParams,
  InvalidConfig,
  DetectorFailed,
};

[[nodiscard]] std::string_view to_string(DetectError error) noexcept;

}  // namespace roomtrace::core
