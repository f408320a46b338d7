#include <roomtrace/app/config.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace roomtrace::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

[[noreturn]] void bad_value(const std::string& key, const std::string& value) {
  throw std::invalid_argument("config: invalid value '" + value + "' for key '" + key + "'");
}

double to_double(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const double v = std::stod(value, &used);
    if (used != value.size()) bad_value(key, value);
    return v;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

long long to_integer(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const long long v = std::stoll(value, &used);
    if (used != value.size()) bad_value(key, value);
    return v;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

int to_int(const std::string& key, const std::string& value) {
  const long long v = to_integer(key, value);
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    bad_value(key, value);
  }
  return static_cast<int>(v);
}

std::uint64_t to_unsigned(const std::string& key, const std::string& value) {
  const long long v = to_integer(key, value);
  if (v < 0) bad_value(key, value);
  return static_cast<std::uint64_t>(v);
}

roomtrace::core::ThresholdMode to_threshold_mode(const std::string& key,
                                                 const std::string& value) {
  if (value == "fixed") return roomtrace::core::ThresholdMode::Fixed;
  if (value == "otsu") return roomtrace::core::ThresholdMode::Otsu;
  if (value == "adaptive") return roomtrace::core::ThresholdMode::Adaptive;
  bad_value(key, value);
}

}  // namespace

ServiceConfig default_config() {
  return ServiceConfig{};
}

ServiceConfig load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  auto& d = c.detector;
  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "min_area_px") d.min_area_px = to_double(key, value);
    else if (key == "max_area_px") d.max_area_px = to_double(key, value);
    else if (key == "simplify_epsilon_ratio") d.simplify_epsilon_ratio = to_double(key, value);
    else if (key == "containment_ratio_threshold") d.containment_ratio_threshold = to_double(key, value);
    else if (key == "morph_kernel_size") d.morph_kernel_size = to_int(key, value);
    else if (key == "morph_iterations") d.morph_iterations = to_int(key, value);
    else if (key == "threshold_mode") d.threshold_mode = to_threshold_mode(key, value);
    else if (key == "binary_threshold") d.binary_threshold = to_int(key, value);
    else if (key == "adaptive_block_size") d.adaptive_block_size = to_int(key, value);
    else if (key == "adaptive_c") d.adaptive_c = to_double(key, value);
    else if (key == "blur_kernel_size") d.blur_kernel_size = to_int(key, value);
    else if (key == "min_contour_points") d.min_contour_points = static_cast<std::size_t>(to_unsigned(key, value));
    else if (key == "min_contour_perimeter") d.min_contour_perimeter = to_double(key, value);
    else if (key == "closet_max_area_px") d.closet_max_area_px = to_double(key, value);
    else if (key == "hallway_min_elongation") d.hallway_min_elongation = to_double(key, value);
    else if (key == "detection_timeout_ms") {
      c.runner.detection_timeout = std::chrono::milliseconds(to_unsigned(key, value));
    }
    else if (key == "store_retry_max_attempts") {
      const auto n = static_cast<std::uint32_t>(to_unsigned(key, value));
      if (n == 0) bad_value(key, value);
      c.runner.store_retry.max_attempts = n;
      c.trigger.store_retry.max_attempts = n;
    }
    else if (key == "store_retry_backoff_ms") {
      const auto ms = std::chrono::milliseconds(to_unsigned(key, value));
      c.runner.store_retry.initial_backoff = ms;
      c.trigger.store_retry.initial_backoff = ms;
    }
    else if (key == "store_retry_multiplier") {
      const double m = to_double(key, value);
      if (m < 1.0) bad_value(key, value);
      c.runner.store_retry.multiplier = m;
      c.trigger.store_retry.multiplier = m;
    }
    else if (key == "key_prefix") c.trigger.key_prefix = value;
  }
  return c;
}

}  // namespace roomtrace::app
