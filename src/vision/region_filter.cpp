#include <roomtrace/vision/region_filter.hpp>
#include <roomtrace/core/logger.hpp>
#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace roomtrace::vision {

NestedDecision classify_nested(double outer_area,
                               double inner_area,
                               double containment_ratio_threshold) noexcept {
  if (inner_area <= 0.0) return NestedDecision::Fixture;
  const double ratio = outer_area / inner_area;
  return ratio > containment_ratio_threshold ? NestedDecision::Fixture
                                             : NestedDecision::SeparateRoom;
}

RegionFilter::RegionFilter(double min_area,
                           double max_area,
                           double containment_ratio_threshold)
    : min_area_(min_area),
      max_area_(max_area),
      containment_ratio_threshold_(containment_ratio_threshold) {}

ContourSet RegionFilter::filter(const ContourSet& contours) const {
  std::unordered_map<std::int32_t, const RawContour*> by_id;
  by_id.reserve(contours.size());
  for (const auto& c : contours) {
    by_id.emplace(c.id, &c);
  }

  std::vector<const RawContour*> candidates;
  for (const auto& c : contours) {
    if (!c.is_hole) continue;
    if (c.area <= 0.0 || c.area < min_area_ || c.area > max_area_) continue;
    candidates.push_back(&c);
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const RawContour* a, const RawContour* b) {
              if (a->depth != b->depth) return a->depth < b->depth;
              return a->id < b->id;
            });

  std::unordered_set<std::int32_t> kept;
  ContourSet out;
  for (const RawContour* c : candidates) {
    const RawContour* outer = nullptr;
    for (std::int32_t p = c->parent; p >= 0;) {
      auto it = by_id.find(p);
      if (it == by_id.end()) break;
      if (kept.contains(p)) {
        outer = it->second;
        break;
      }
      p = it->second->parent;
    }

    if (outer &&
        classify_nested(outer->area, c->area, containment_ratio_threshold_) ==
            NestedDecision::Fixture) {
      ROOMTRACE_LOG_DEBUG("region filter: contour " + std::to_string(c->id) +
                          " treated as fixture inside " + std::to_string(outer->id));
      continue;
    }
    kept.insert(c->id);
    out.push_back(*c);
  }

  std::sort(out.begin(), out.end(),
            [](const RawContour& a, const RawContour& b) { return a.id < b.id; });
  return out;
}

}  // namespace roomtrace::vision
