// Point patterns: ordered point sequences that can be translated and
// compared up to translation.

#ifndef REPAT_CORE_PATTERN_H
#define REPAT_CORE_PATTERN_H

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/point.h"
#include "core/point_set.h"

namespace repat {

/// Translation-invariant shape of a pattern: each point minus the first.
using ShapeKey = std::vector<Vector>;

/// @brief Ordered, non-empty sequence of distinct points.
///
/// Element order is the order the pattern was built or discovered in; it is
/// kept for reproducible output but plays no part in shape equivalence of
/// discovered (sorted) patterns. Patterns are plain values.
class Pattern {
 public:
  Pattern() = default;
  explicit Pattern(std::vector<Point> points) : points_(std::move(points)) {}

  size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }

  const Point& operator[](size_t idx) const { return points_[idx]; }
  const Point& front() const { return points_.front(); }

  std::vector<Point>::const_iterator begin() const { return points_.begin(); }
  std::vector<Point>::const_iterator end() const { return points_.end(); }

  const std::vector<Point>& points() const { return points_; }

  /// @brief New pattern with every point shifted by @p translation.
  Pattern translate(const Vector& translation) const;

  /// @brief Shape key: every point minus the first point, in element order.
  ShapeKey normalized() const;

  /// @brief Vector that maps this pattern element-wise onto @p other.
  /// @return The translation, or nullopt if sizes differ or @p other is not
  ///         an element-wise translate of this pattern.
  std::optional<Vector> translationTo(const Pattern& other) const;

  /// @brief True if @p other is an element-wise translate of this pattern.
  bool isTranslationOf(const Pattern& other) const {
    return translationTo(other).has_value();
  }

  /// @brief True if every point lies in @p point_set.
  bool isSubsetOf(const PointSet& point_set) const;

  bool operator==(const Pattern& other) const { return points_ == other.points_; }
  bool operator!=(const Pattern& other) const { return !(*this == other); }

  /// @brief Render as "[(o, p), (o, p), ...]".
  std::string toString() const;

 private:
  std::vector<Point> points_;
};

/// @brief Check the pattern invariants for externally supplied points.
///
/// Rejects empty input, non-finite pitches and coordinate-equal duplicates.
///
/// @param points Candidate pattern points.
/// @param error Receives a human-readable reason on failure.
/// @return True if @p points form a valid pattern.
bool validatePattern(const std::vector<Point>& points, std::string& error);

}  // namespace repat

#endif  // REPAT_CORE_PATTERN_H
