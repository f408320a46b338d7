#pragma once

#include <roomtrace/core/error.hpp>
#include <roomtrace/core/raster.hpp>
#include <roomtrace/core/room.hpp>
#include <expected>
#include <variant>

namespace roomtrace::core {

/// Output of a pipeline stage: either a transformed Raster or the final RoomList.
using StageOutput = std::variant<Raster, RoomList>;

/// Abstract pipeline stage: process one Raster, return Raster (continue) or RoomList (done).
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, DetectError> process(
      const Raster& input) = 0;
};

}  // namespace roomtrace::core
