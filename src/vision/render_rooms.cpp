#include <roomtrace/vision/render_rooms.hpp>
#include "raster_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <vector>

namespace roomtrace::vision {

namespace rc = roomtrace::core;

std::optional<rc::Raster> render_rooms(const rc::Raster& image, const rc::RoomList& rooms) {
  auto src = detail::raster_to_mat(image);
  if (!src) return std::nullopt;

  cv::Mat canvas;
  switch (image.format()) {
    case rc::PixelFormat::Grayscale8:
    case rc::PixelFormat::Mask8:
      cv::cvtColor(*src, canvas, cv::COLOR_GRAY2BGR);
      break;
    case rc::PixelFormat::BGRA8:
      cv::cvtColor(*src, canvas, cv::COLOR_BGRA2BGR);
      break;
    default:
      canvas = src->clone();
      break;
  }

  const cv::Scalar outline(0, 255, 0);
  const cv::Scalar label(255, 0, 0);
  for (const auto& room : rooms) {
    std::vector<cv::Point> pts;
    pts.reserve(room.polygon.size());
    for (const auto& p : room.polygon) {
      pts.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
    }
    if (pts.size() >= 2) {
      cv::polylines(canvas, pts, true, outline, 2);
    }
    const cv::Point anchor(static_cast<int>(std::lround(room.centroid.x)),
                           static_cast<int>(std::lround(room.centroid.y)));
    cv::putText(canvas, room.id, anchor, cv::FONT_HERSHEY_SIMPLEX, 0.5, label, 2);
  }

  return detail::mat_to_raster(canvas, rc::PixelFormat::BGR8);
}

}  // namespace roomtrace::vision
