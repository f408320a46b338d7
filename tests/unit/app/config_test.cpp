#include <roomtrace/app/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace ra = roomtrace::app;
namespace rc = roomtrace::core;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& text) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path);
  f << text;
  return path;
}

}  // namespace

TEST(Config, DefaultConfig) {
  const ra::ServiceConfig c = ra::default_config();
  EXPECT_DOUBLE_EQ(c.detector.min_area_px, 1000.0);
  EXPECT_EQ(c.trigger.key_prefix, "blueprints/");
  EXPECT_EQ(c.runner.detection_timeout.count(), 60000);
  EXPECT_EQ(c.runner.store_retry.max_attempts, 3u);
}

TEST(Config, MissingFileYieldsDefaults) {
  const ra::ServiceConfig c = ra::load_config("/nonexistent/roomtrace.conf");
  EXPECT_DOUBLE_EQ(c.detector.max_area_px, rc::DetectorParams{}.max_area_px);
}

TEST(Config, LoadsKeyValues) {
  const auto path = write_temp("roomtrace_config_test.conf",
                               "# detector\n"
                               "min_area_px = 2500\n"
                               "max_area_px=400000\n"
                               "threshold_mode = adaptive\n"
                               "adaptive_block_size = 15\n"
                               "blur_kernel_size = 5\n"
                               "closet_max_area_px = 4000\n"
                               "detection_timeout_ms = 1500\n"
                               "store_retry_max_attempts = 5\n"
                               "key_prefix = uploads/\n"
                               "unknown_key = whatever\n"
                               "not a key value line\n");
  const ra::ServiceConfig c = ra::load_config(path.string());
  EXPECT_DOUBLE_EQ(c.detector.min_area_px, 2500.0);
  EXPECT_DOUBLE_EQ(c.detector.max_area_px, 400000.0);
  EXPECT_EQ(c.detector.threshold_mode, rc::ThresholdMode::Adaptive);
  EXPECT_EQ(c.detector.adaptive_block_size, 15);
  EXPECT_EQ(c.detector.blur_kernel_size, 5);
  EXPECT_DOUBLE_EQ(c.detector.closet_max_area_px, 4000.0);
  EXPECT_EQ(c.runner.detection_timeout.count(), 1500);
  EXPECT_EQ(c.runner.store_retry.max_attempts, 5u);
  EXPECT_EQ(c.trigger.store_retry.max_attempts, 5u);
  EXPECT_EQ(c.trigger.key_prefix, "uploads/");
  EXPECT_TRUE(rc::validate(c.detector).has_value());
  std::filesystem::remove(path);
}

TEST(Config, MalformedNumberNamesKey) {
  const auto path = write_temp("roomtrace_config_bad.conf", "min_area_px = lots\n");
  try {
    (void)ra::load_config(path.string());
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("min_area_px"), std::string::npos);
  }
  std::filesystem::remove(path);
}

TEST(Config, TrailingGarbageRejected) {
  const auto path = write_temp("roomtrace_config_trailing.conf", "morph_kernel_size = 3px\n");
  EXPECT_THROW((void)ra::load_config(path.string()), std::invalid_argument);
  std::filesystem::remove(path);
}

TEST(Config, UnknownThresholdModeRejected) {
  const auto path = write_temp("roomtrace_config_mode.conf", "threshold_mode = magic\n");
  EXPECT_THROW((void)ra::load_config(path.string()), std::invalid_argument);
  std::filesystem::remove(path);
}
