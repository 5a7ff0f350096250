/// @file
/// @brief Pattern translation, shape keys and validation.

#include "core/pattern.h"

#include <algorithm>
#include <cmath>

namespace repat {

Pattern Pattern::translate(const Vector& translation) const {
  std::vector<Point> shifted;
  shifted.reserve(points_.size());
  for (const auto& point : points_) {
    shifted.push_back(point + translation);
  }
  return Pattern(std::move(shifted));
}

ShapeKey Pattern::normalized() const {
  ShapeKey key;
  if (points_.empty()) return key;
  key.reserve(points_.size());
  const Point& origin = points_.front();
  for (const auto& point : points_) {
    key.push_back(point - origin);
  }
  return key;
}

std::optional<Vector> Pattern::translationTo(const Pattern& other) const {
  if (points_.size() != other.points_.size() || points_.empty()) return std::nullopt;

  Vector translation = other.points_.front() - points_.front();
  for (size_t idx = 1; idx < points_.size(); ++idx) {
    if (points_[idx] + translation != other.points_[idx]) return std::nullopt;
  }
  return translation;
}

bool Pattern::isSubsetOf(const PointSet& point_set) const {
  return std::all_of(points_.begin(), points_.end(),
                     [&point_set](const Point& point) { return point_set.contains(point); });
}

std::string Pattern::toString() const {
  std::string result = "[";
  for (size_t idx = 0; idx < points_.size(); ++idx) {
    if (idx > 0) result += ", ";
    result += points_[idx].toString();
  }
  result += "]";
  return result;
}

bool validatePattern(const std::vector<Point>& points, std::string& error) {
  if (points.empty()) {
    error = "pattern is empty";
    return false;
  }

  for (const auto& point : points) {
    if (!std::isfinite(point.pitch)) {
      error = "pattern contains a non-finite pitch";
      return false;
    }
  }

  std::vector<Point> sorted = points;
  std::sort(sorted.begin(), sorted.end());
  auto dup = std::adjacent_find(sorted.begin(), sorted.end());
  if (dup != sorted.end()) {
    error = "pattern contains duplicate point " + dup->toString();
    return false;
  }

  return true;
}

}  // namespace repat
