// Sorted, duplicate-free point set with membership queries.

#ifndef REPAT_CORE_POINT_SET_H
#define REPAT_CORE_POINT_SET_H

#include <cstddef>
#include <optional>
#include <vector>

#include "core/point.h"

namespace repat {

/// @brief Immutable point set in canonical (onset, pitch) order.
///
/// Construction sorts the input and drops duplicates, so storage is strictly
/// increasing. Read-only afterwards; safe to share between independent
/// discovery and matching calls.
class PointSet {
 public:
  PointSet() = default;

  /// @brief Build from points in any order (duplicates allowed).
  explicit PointSet(std::vector<Point> points);

  size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }

  const Point& operator[](size_t idx) const { return points_[idx]; }

  std::vector<Point>::const_iterator begin() const { return points_.begin(); }
  std::vector<Point>::const_iterator end() const { return points_.end(); }

  /// @brief Sorted point storage.
  const std::vector<Point>& points() const { return points_; }

  /// @brief Membership test (binary search).
  bool contains(const Point& point) const;

  /// @brief Position of @p point in canonical order, if present.
  std::optional<size_t> indexOf(const Point& point) const;

 private:
  std::vector<Point> points_;
};

}  // namespace repat

#endif  // REPAT_CORE_POINT_SET_H
