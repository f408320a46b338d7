#include <roomtrace/core/error.hpp>

namespace roomtrace::core {

std::string_view to_string(DetectError error) noexcept {
  switch (error) {
    case DetectError::None:
      return "none";
    case DetectError::InvalidImage:
      return "invalid image";
    case DetectError::DecodeError:
      return "image could not be decoded";
    case DetectError::InvalidParams:
      return "invalid detector parameters";
    case DetectError::InvalidConfig:
      return "invalid pipeline configuration";
    case DetectError::DetectorFailed:
      return "detector failed";
    default:
      return "unknown error";
  }
}

}  // namespace roomtrace::core
