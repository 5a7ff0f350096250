// Translational equivalence classes: a pattern plus every translation under
// which it recurs in a point set.

#ifndef REPAT_CORE_TEC_H
#define REPAT_CORE_TEC_H

#include <vector>

#include "core/pattern.h"
#include "core/point.h"
#include "core/point_set.h"

namespace repat {

/// @brief Translational equivalence class (TEC).
///
/// Invariants for TECs produced by discovery:
///   - translators are sorted ascending and contain no duplicates,
///   - the zero vector is a translator (the pattern is its own occurrence),
///   - pattern.translate(t) lies in the source point set for every t.
struct Tec {
  Pattern pattern;
  std::vector<Vector> translators;

  /// @brief Every occurrence: pattern.translate(t) per translator, in order.
  std::vector<Pattern> occurrences() const;

  /// @brief Union of all occurrences, sorted and de-duplicated.
  std::vector<Point> coveredPoints() const;

  /// @brief True if every occurrence is contained in @p point_set.
  bool isSoundFor(const PointSet& point_set) const;

  bool operator==(const Tec& other) const {
    return pattern == other.pattern && translators == other.translators;
  }
  bool operator!=(const Tec& other) const { return !(*this == other); }
};

}  // namespace repat

#endif  // REPAT_CORE_TEC_H
