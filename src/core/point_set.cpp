// PointSet construction and lookup.

#include "core/point_set.h"

#include <algorithm>
#include <utility>

namespace repat {

PointSet::PointSet(std::vector<Point> points) : points_(std::move(points)) {
  std::sort(points_.begin(), points_.end());
  points_.erase(std::unique(points_.begin(), points_.end()), points_.end());
}

bool PointSet::contains(const Point& point) const {
  return std::binary_search(points_.begin(), points_.end(), point);
}

std::optional<size_t> PointSet::indexOf(const Point& point) const {
  auto iter = std::lower_bound(points_.begin(), points_.end(), point);
  if (iter == points_.end() || *iter != point) return std::nullopt;
  return static_cast<size_t>(iter - points_.begin());
}

}  // namespace repat
