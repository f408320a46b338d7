#include <roomtrace/core/raster.hpp>
#include <roomtrace/vision/contour_extractor.hpp>
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstring>
#include <vector>

namespace rc = roomtrace::core;
namespace rv = roomtrace::vision;

namespace {

rc::Raster to_mask(const cv::Mat& m) {
  std::vector<std::byte> buf(m.total());
  std::memcpy(buf.data(), m.data, buf.size());
  return rc::Raster(static_cast<std::uint32_t>(m.cols), static_cast<std::uint32_t>(m.rows),
                    rc::PixelFormat::Mask8, std::move(buf));
}

// Wall ring whose free interior spans [x0, x1) x [y0, y1).
void ring(cv::Mat& m, int x0, int y0, int x1, int y1, int wall) {
  cv::rectangle(m, cv::Point(x0 - wall, y0 - wall), cv::Point(x1 + wall - 1, y1 + wall - 1),
                cv::Scalar(255), cv::FILLED);
  cv::rectangle(m, cv::Point(x0, y0), cv::Point(x1 - 1, y1 - 1), cv::Scalar(0), cv::FILLED);
}

}  // namespace

TEST(ContourExtractor, EmptyMaskHasNoContours) {
  cv::Mat m = cv::Mat::zeros(50, 50, CV_8UC1);
  rv::ContourExtractor ex(8, 24.0);
  auto set = ex.extract(to_mask(m));
  ASSERT_TRUE(set.has_value());
  EXPECT_TRUE(set->empty());
}

TEST(ContourExtractor, RingHasOuterAndHole) {
  cv::Mat m = cv::Mat::zeros(200, 200, CV_8UC1);
  ring(m, 50, 50, 150, 150, 5);
  rv::ContourExtractor ex(8, 24.0);
  auto set = ex.extract(to_mask(m));
  ASSERT_TRUE(set.has_value());
  ASSERT_EQ(set->size(), 2u);

  const auto outer = std::find_if(set->begin(), set->end(),
                                  [](const rv::RawContour& c) { return !c.is_hole; });
  const auto hole = std::find_if(set->begin(), set->end(),
                                 [](const rv::RawContour& c) { return c.is_hole; });
  ASSERT_NE(outer, set->end());
  ASSERT_NE(hole, set->end());
  EXPECT_EQ(outer->depth, 0);
  EXPECT_EQ(outer->parent, -1);
  EXPECT_EQ(hole->depth, 1);
  EXPECT_EQ(hole->parent, outer->id);
  EXPECT_NEAR(hole->area, 101.0 * 101.0, 1.0);
  EXPECT_GT(outer->area, hole->area);
  EXPECT_GT(hole->points.size(), 4u);  // dense chain
}

TEST(ContourExtractor, NestedRingDepths) {
  cv::Mat m = cv::Mat::zeros(300, 300, CV_8UC1);
  ring(m, 40, 40, 260, 260, 5);
  ring(m, 100, 100, 160, 160, 3);
  rv::ContourExtractor ex(8, 24.0);
  auto set = ex.extract(to_mask(m));
  ASSERT_TRUE(set.has_value());
  ASSERT_EQ(set->size(), 4u);
  std::vector<int> depths;
  for (const auto& c : *set) depths.push_back(c.depth);
  std::sort(depths.begin(), depths.end());
  EXPECT_EQ(depths, (std::vector<int>{0, 1, 2, 3}));
  for (const auto& c : *set) {
    EXPECT_EQ(c.is_hole, c.depth % 2 == 1);
  }
}

TEST(ContourExtractor, DropsSpecksAndRelinksParents) {
  cv::Mat m = cv::Mat::zeros(200, 200, CV_8UC1);
  ring(m, 50, 50, 150, 150, 5);
  cv::rectangle(m, cv::Point(100, 100), cv::Point(101, 101), cv::Scalar(255), cv::FILLED);
  rv::ContourExtractor ex(8, 24.0);
  auto set = ex.extract(to_mask(m));
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(set->size(), 2u);

  rv::ContourExtractor permissive(1, 0.0);
  auto all = permissive.extract(to_mask(m));
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->size(), 3u);
}

TEST(ContourExtractor, RequiresMask) {
  std::vector<std::byte> buf(16);
  rc::Raster gray(4, 4, rc::PixelFormat::Grayscale8, std::move(buf));
  rv::ContourExtractor ex(8, 24.0);
  auto set = ex.extract(gray);
  ASSERT_FALSE(set.has_value());
  EXPECT_EQ(set.error(), rc::DetectError::InvalidImage);
}
