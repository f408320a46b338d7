#include <roomtrace/core/detector_params.hpp>
#include <gtest/gtest.h>
#include <limits>

namespace rc = roomtrace::core;

TEST(DetectorParams, DefaultsAreValid) {
  const rc::DetectorParams p;
  EXPECT_TRUE(rc::validate(p).has_value());
  EXPECT_DOUBLE_EQ(p.min_area_px, 1000.0);
  EXPECT_DOUBLE_EQ(p.simplify_epsilon_ratio, 0.01);
  EXPECT_EQ(p.threshold_mode, rc::ThresholdMode::Fixed);
}

TEST(DetectorParams, RejectsInvertedAreaBounds) {
  rc::DetectorParams p;
  p.min_area_px = 5000;
  p.max_area_px = 100;
  auto r = rc::validate(p);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), rc::DetectError::InvalidParams);
}

TEST(DetectorParams, RejectsNonFiniteArea) {
  rc::DetectorParams p;
  p.max_area_px = std::numeric_limits<double>::infinity();
  EXPECT_FALSE(rc::validate(p).has_value());
  p.max_area_px = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(rc::validate(p).has_value());
}

TEST(DetectorParams, RejectsBadEpsilonAndRatio) {
  rc::DetectorParams p;
  p.simplify_epsilon_ratio = -0.1;
  EXPECT_FALSE(rc::validate(p).has_value());
  p.simplify_epsilon_ratio = 0.0;
  EXPECT_TRUE(rc::validate(p).has_value());

  p.containment_ratio_threshold = 0.5;
  EXPECT_FALSE(rc::validate(p).has_value());
}

TEST(DetectorParams, AdaptiveNeedsOddBlock) {
  rc::DetectorParams p;
  p.threshold_mode = rc::ThresholdMode::Adaptive;
  p.adaptive_block_size = 10;
  EXPECT_FALSE(rc::validate(p).has_value());
  p.adaptive_block_size = 11;
  EXPECT_TRUE(rc::validate(p).has_value());
}

TEST(DetectorParams, BlurKernelMustBeOddOrZero) {
  rc::DetectorParams p;
  p.blur_kernel_size = 4;
  EXPECT_FALSE(rc::validate(p).has_value());
  p.blur_kernel_size = 5;
  EXPECT_TRUE(rc::validate(p).has_value());
  p.blur_kernel_size = 0;
  EXPECT_TRUE(rc::validate(p).has_value());
}

TEST(DetectorParams, MorphAndThresholdRanges) {
  rc::DetectorParams p;
  p.morph_iterations = 0;
  EXPECT_FALSE(rc::validate(p).has_value());
  p.morph_iterations = 1;
  p.binary_threshold = 256;
  EXPECT_FALSE(rc::validate(p).has_value());
}

TEST(DetectorParams, MorphKernelMustBeOddOrDisabled) {
  rc::DetectorParams p;
  for (int size : {0, 1, 3, 5}) {
    p.morph_kernel_size = size;
    EXPECT_TRUE(rc::validate(p).has_value()) << size;
  }
  for (int size : {2, 4, -1}) {
    p.morph_kernel_size = size;
    EXPECT_FALSE(rc::validate(p).has_value()) << size;
  }
}

TEST(DetectorParams, ThresholdModeNames) {
  EXPECT_EQ(rc::to_string(rc::ThresholdMode::Fixed), "fixed");
  EXPECT_EQ(rc::to_string(rc::ThresholdMode::Otsu), "otsu");
  EXPECT_EQ(rc::to_string(rc::ThresholdMode::Adaptive), "adaptive");
}
