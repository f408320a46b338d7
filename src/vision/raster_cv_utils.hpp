#pragma once

#include <roomtrace/core/raster.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace roomtrace::vision::detail {

/// Wrap a Raster as a cv::Mat header over its buffer (no copy). Returns
/// nullopt if the raster is invalid or the format unsupported.
std::optional<cv::Mat> raster_to_mat(const roomtrace::core::Raster& raster);

/// Copy a cv::Mat (8-bit, 1/3/4 channels) into a Raster of the given format.
roomtrace::core::Raster mat_to_raster(const cv::Mat& mat,
                                      roomtrace::core::PixelFormat format);

}  // namespace roomtrace::vision::detail
