#include <roomtrace/vision/raw_contour.hpp>
#include <roomtrace/vision/region_filter.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace rv = roomtrace::vision;

namespace {

rv::RawContour contour(int id, int parent, int depth, double area) {
  rv::RawContour c;
  c.id = id;
  c.parent = parent;
  c.depth = depth;
  c.is_hole = depth % 2 == 1;
  c.area = area;
  return c;
}

std::vector<int> ids(const rv::ContourSet& set) {
  std::vector<int> out;
  for (const auto& c : set) out.push_back(c.id);
  return out;
}

}  // namespace

TEST(ClassifyNested, RatioAboveThresholdIsFixture) {
  EXPECT_EQ(rv::classify_nested(120000, 1000, 20), rv::NestedDecision::Fixture);
  EXPECT_EQ(rv::classify_nested(120000, 10000, 20), rv::NestedDecision::SeparateRoom);
  EXPECT_EQ(rv::classify_nested(2000, 100, 20), rv::NestedDecision::SeparateRoom);  // exactly 20
  EXPECT_EQ(rv::classify_nested(2000, 0, 20), rv::NestedDecision::Fixture);
}

TEST(RegionFilter, KeepsOnlyHolesInsideAreaBounds) {
  const rv::ContourSet set{
      contour(0, -1, 0, 200000),  // wall outline
      contour(1, 0, 1, 120000),   // room
      contour(2, -1, 0, 900),     // wall outline of a small block
      contour(3, 2, 1, 500),      // too small
  };
  rv::RegionFilter filter(1000, 1e6, 20);
  EXPECT_EQ(ids(filter.filter(set)), (std::vector<int>{1}));
}

TEST(RegionFilter, DropsOversizedHoles) {
  const rv::ContourSet set{contour(0, -1, 0, 5e6), contour(1, 0, 1, 4e6)};
  rv::RegionFilter filter(1000, 1e6, 20);
  EXPECT_TRUE(filter.filter(set).empty());
}

TEST(RegionFilter, NestedClosetKeptAsSeparateRoom) {
  const rv::ContourSet set{
      contour(0, -1, 0, 150000),
      contour(1, 0, 1, 120000),
      contour(2, 1, 2, 14000),
      contour(3, 2, 3, 10000),  // ratio 12
  };
  rv::RegionFilter filter(1000, 1e6, 20);
  EXPECT_EQ(ids(filter.filter(set)), (std::vector<int>{1, 3}));
}

TEST(RegionFilter, NestedFixtureDropped) {
  const rv::ContourSet set{
      contour(0, -1, 0, 150000),
      contour(1, 0, 1, 120000),
      contour(2, 1, 2, 2500),
      contour(3, 2, 3, 1600),  // ratio 75
  };
  rv::RegionFilter filter(1000, 1e6, 20);
  EXPECT_EQ(ids(filter.filter(set)), (std::vector<int>{1}));
}

TEST(RegionFilter, NestedInsideDroppedOuterIsIndependent) {
  // Outer hole is over max_area, so the inner one has no candidate ancestor.
  const rv::ContourSet set{
      contour(0, -1, 0, 3e6),
      contour(1, 0, 1, 2e6),
      contour(2, 1, 2, 12000),
      contour(3, 2, 3, 10000),
  };
  rv::RegionFilter filter(1000, 1e6, 20);
  EXPECT_EQ(ids(filter.filter(set)), (std::vector<int>{3}));
}

TEST(RegionFilter, ResultIndependentOfInputOrder) {
  rv::ContourSet set{
      contour(0, -1, 0, 150000), contour(1, 0, 1, 120000),
      contour(2, 1, 2, 14000),   contour(3, 2, 3, 10000),
      contour(4, 1, 2, 2500),    contour(5, 4, 3, 1600),
  };
  rv::RegionFilter filter(1000, 1e6, 20);
  const auto forward = ids(filter.filter(set));
  std::reverse(set.begin(), set.end());
  EXPECT_EQ(ids(filter.filter(set)), forward);
  EXPECT_EQ(forward, (std::vector<int>{1, 3}));
}
