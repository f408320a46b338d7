#pragma once

#include <roomtrace/core/raster.hpp>
#include <roomtrace/core/room.hpp>
#include <optional>

namespace roomtrace::vision {

/// Draw each room outline and its id (at the centroid) onto a BGR8 copy of
/// image. Returns nullopt if image is not a valid raster.
[[nodiscard]] std::optional<roomtrace::core::Raster> render_rooms(
    const roomtrace::core::Raster& image, const roomtrace::core::RoomList& rooms);

}  // namespace roomtrace::vision
