/**
 * roomtrace-cli: detect room boundaries in a blueprint image; output JSON.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/roomtrace_cli --input plan.png [--config path] [--output path]
 * Writes the detection result to output/<basename>.json unless --output is given.
 */

#include <roomtrace/app/config.hpp>
#include <roomtrace/app/image_source.hpp>
#include <roomtrace/app/in_memory_job_store.hpp>
#include <roomtrace/app/ingestion_trigger.hpp>
#include <roomtrace/app/job_runner.hpp>
#include <roomtrace/app/job_state_machine.hpp>
#include <roomtrace/app/result_codec.hpp>
#include <roomtrace/app/status_query.hpp>
#include <roomtrace/core/detection_result.hpp>
#include <roomtrace/core/detector_params.hpp>
#include <roomtrace/core/logger.hpp>
#include <roomtrace/core/pipeline.hpp>
#include <roomtrace/vision/contour_room_detector.hpp>
#include <roomtrace/vision/decode_image.hpp>
#include <roomtrace/vision/render_rooms.hpp>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* const kStageNames[] = {"grayscale", "binarize", "morph_close", "room_extraction"};

void print_usage() {
  std::cout << "Usage: roomtrace_cli --input <image> [options]\n"
            << "  --input <path>      Blueprint image (PNG/JPEG)\n"
            << "  --config <path>     Service config (key=value file); default: built-in\n"
            << "  --output <path>     Result JSON; default: output/<basename>.json\n"
            << "  --visualize <path>  Draw detected rooms onto a copy of the image\n"
            << "  --min-area <px>     Override min_area_px\n"
            << "  --max-area <px>     Override max_area_px\n"
            << "  --job               Run through the job trigger/runner and print job status\n";
}

bool write_json(const std::filesystem::path& path, const nlohmann::json& j) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream f(path);
  if (!f) return false;
  f << j.dump(2) << "\n";
  return static_cast<bool>(f);
}

int run_direct(const std::string& input_path,
               const roomtrace::app::ServiceConfig& cfg,
               const std::filesystem::path& output_path,
               const std::string& visualize_path) {
  auto raster = roomtrace::vision::load_raster_from_file(input_path);
  if (!raster) {
    std::cerr << "Failed to load image: " << input_path << "\n";
    return 1;
  }

  roomtrace::core::StageTimingCallback timing = [](std::size_t stage, double ms) {
    const char* name = stage < std::size(kStageNames) ? kStageNames[stage] : "stage";
    ROOMTRACE_LOG_DEBUG(std::string(name) + ": " + std::to_string(ms) + " ms");
  };

  const roomtrace::vision::ContourRoomDetector detector;
  auto rooms = detector.detect_raster(*raster, cfg.detector, &timing);
  if (!rooms) {
    std::cerr << "Detection error: " << roomtrace::core::to_string(rooms.error()) << "\n";
    return 1;
  }

  std::cout << "rooms=" << rooms->size() << " image=" << raster->width() << "x"
            << raster->height() << "\n";
  for (const auto& room : *rooms) {
    std::cout << "  " << room.id << " area=" << room.area << " perimeter=" << room.perimeter
              << " vertices=" << room.polygon.size() << " confidence=" << room.confidence;
    if (room.name_hint) std::cout << " hint=" << *room.name_hint;
    std::cout << "\n";
  }

  roomtrace::core::DetectionResult result;
  result.job_id = std::filesystem::path(input_path).stem().string();
  result.rooms = std::move(*rooms);
  result.params = cfg.detector;
  if (!write_json(output_path, roomtrace::app::result_to_json(result))) {
    std::cerr << "Warning: could not write " << output_path << "\n";
  } else {
    std::cout << "Results saved to: " << output_path.string() << "\n";
  }

  if (!visualize_path.empty()) {
    auto viz = roomtrace::vision::render_rooms(*raster, result.rooms);
    if (!viz || !roomtrace::vision::write_png(visualize_path, *viz)) {
      std::cerr << "Warning: could not write " << visualize_path << "\n";
    } else {
      std::cout << "Visualization saved to: " << visualize_path << "\n";
    }
  }
  return 0;
}

int run_job(const std::string& input_path,
            const roomtrace::app::ServiceConfig& cfg,
            const std::filesystem::path& output_path) {
  using namespace roomtrace::app;

  const std::filesystem::path input(input_path);
  const FileImageSource files(input.has_parent_path() ? input.parent_path()
                                                      : std::filesystem::path("."));
  auto bytes = files.fetch(input.filename().string());
  if (!bytes) {
    std::cerr << "Failed to read image: " << input_path << " (" << to_string(bytes.error())
              << ")\n";
    return 1;
  }

  const std::string image_ref = cfg.trigger.key_prefix + input.filename().string();
  InMemoryImageSource images;
  images.put(image_ref, std::move(*bytes));

  InMemoryJobStore store;
  JobStateMachine jobs(store);
  const roomtrace::vision::ContourRoomDetector detector;
  JobRunner runner(jobs, images, detector, cfg.detector, cfg.runner);
  IngestionTrigger trigger(jobs, cfg.trigger,
                           [&runner](const roomtrace::core::JobId& id) { runner.run(id); });

  const ImageNotification notification{image_ref, std::nullopt};
  const TriggerOutcome outcome = trigger.deliver(notification);
  std::cout << "trigger: " << to_string(outcome) << "\n";
  if (outcome != TriggerOutcome::Started) {
    return 1;
  }

  const StatusQueryService status(store);
  auto view = status.query(derive_job_id(image_ref));
  if (!view) {
    std::cerr << "Status error: " << to_string(view.error()) << "\n";
    return 1;
  }
  const nlohmann::json j = status_to_json(*view);
  std::cout << j.dump(2) << "\n";
  if (!write_json(output_path, j)) {
    std::cerr << "Warning: could not write " << output_path << "\n";
  }
  return view->job.state == roomtrace::core::JobState::Completed ? 0 : 1;
}

std::optional<double> parse_number(const std::string& flag, const std::string& value) {
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(value, &used);
  } catch (const std::logic_error& e) {
    std::cerr << "Invalid number for " << flag << ": " << value << " (" << e.what() << ")\n";
    return std::nullopt;
  }
  if (used != value.size()) {
    std::cerr << "Invalid number for " << flag << ": " << value << "\n";
    return std::nullopt;
  }
  return v;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string output_path;
  std::string visualize_path;
  std::optional<double> min_area;
  std::optional<double> max_area;
  bool job_mode = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--visualize" && i + 1 < argc) {
      visualize_path = argv[++i];
    } else if (arg == "--min-area" && i + 1 < argc) {
      min_area = parse_number(arg, argv[++i]);
      if (!min_area) return 1;
    } else if (arg == "--max-area" && i + 1 < argc) {
      max_area = parse_number(arg, argv[++i]);
      if (!max_area) return 1;
    } else if (arg == "--job") {
      job_mode = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (input_path.empty()) {
    print_usage();
    return 1;
  }

  roomtrace::app::ServiceConfig cfg;
  try {
    cfg = config_path.empty() ? roomtrace::app::default_config()
                              : roomtrace::app::load_config(config_path);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  if (min_area) cfg.detector.min_area_px = *min_area;
  if (max_area) cfg.detector.max_area_px = *max_area;

  if (auto ok = roomtrace::core::validate(cfg.detector); !ok) {
    std::cerr << "Invalid detector parameters: " << roomtrace::core::to_string(ok.error())
              << "\n";
    return 1;
  }

  std::filesystem::path out_file = output_path;
  if (out_file.empty()) {
    out_file = std::filesystem::path("output") /
               (std::filesystem::path(input_path).stem().string() + ".json");
  }

  ROOMTRACE_LOG_INFO("roomtrace_cli: processing " + input_path);
  return job_mode ? run_job(input_path, cfg, out_file)
                  : run_direct(input_path, cfg, out_file, visualize_path);
}
