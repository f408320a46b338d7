#include <roomtrace/vision/contour_room_detector.hpp>
#include <roomtrace/core/logger.hpp>
#include <roomtrace/vision/binarize_stage.hpp>
#include <roomtrace/vision/decode_image.hpp>
#include <roomtrace/vision/grayscale_stage.hpp>
#include <roomtrace/vision/morph_close_stage.hpp>
#include <roomtrace/vision/room_extraction_stage.hpp>
#include <opencv2/core.hpp>
#include <memory>
#include <string>

namespace roomtrace::vision {

namespace rc = roomtrace::core;

namespace {

constexpr std::size_t kPreprocessStageCount = 3;

}  // namespace

rc::Pipeline build_detection_pipeline(const rc::DetectorParams& params) {
  rc::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<GrayscaleStage>());
  pipeline.add_stage(std::make_unique<BinarizeStage>(
      params.threshold_mode, params.binary_threshold, params.adaptive_block_size,
      params.adaptive_c, params.blur_kernel_size));
  pipeline.add_stage(
      std::make_unique<MorphCloseStage>(params.morph_kernel_size, params.morph_iterations));
  pipeline.add_stage(std::make_unique<RoomExtractionStage>(params));
  return pipeline;
}

std::expected<rc::Raster, rc::DetectError> preprocess(const rc::Raster& raster,
                                                      const rc::DetectorParams& params) {
  if (auto ok = rc::validate(params); !ok) {
    return std::unexpected(ok.error());
  }
  try {
    rc::Pipeline pipeline = build_detection_pipeline(params);
    return pipeline.run_prefix(raster, kPreprocessStageCount);
  } catch (const cv::Exception& e) {
    ROOMTRACE_LOG_ERROR(std::string("preprocess: ") + e.what());
    return std::unexpected(rc::DetectError::DetectorFailed);
  }
}

std::expected<rc::RoomList, rc::DetectError> ContourRoomDetector::detect(
    std::span<const std::byte> image_bytes, const rc::DetectorParams& params) const {
  if (image_bytes.empty()) {
    return std::unexpected(rc::DetectError::InvalidImage);
  }
  if (auto ok = rc::validate(params); !ok) {
    return std::unexpected(ok.error());
  }
  auto raster = decode_image(image_bytes);
  if (!raster) {
    return std::unexpected(raster.error());
  }
  return detect_raster(*raster, params);
}

std::expected<rc::RoomList, rc::DetectError> ContourRoomDetector::detect_raster(
    const rc::Raster& raster,
    const rc::DetectorParams& params,
    rc::StageTimingCallback* timing_cb) const {
  if (!raster.is_valid()) {
    return std::unexpected(rc::DetectError::InvalidImage);
  }
  if (auto ok = rc::validate(params); !ok) {
    return std::unexpected(ok.error());
  }

  try {
    rc::Pipeline pipeline = build_detection_pipeline(params);
    auto rooms = pipeline.run(raster, timing_cb);
    if (rooms) {
      ROOMTRACE_LOG_DEBUG("contour detector: " + std::to_string(rooms->size()) +
                          " room(s) in " + std::to_string(raster.width()) + "x" +
                          std::to_string(raster.height()) + " image");
    }
    return rooms;
  } catch (const cv::Exception& e) {
    ROOMTRACE_LOG_ERROR(std::string("contour detector: ") + e.what());
    return std::unexpected(rc::DetectError::DetectorFailed);
  }
}

}  // namespace roomtrace::vision
