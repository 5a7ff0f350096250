// Synthetic point sets for exercising discovery and matching.

#ifndef REPAT_CORE_POINT_SET_GENERATOR_H
#define REPAT_CORE_POINT_SET_GENERATOR_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/point.h"

namespace repat {
namespace generator {

/// @brief Parameters for randomRepeatedPatterns().
struct RepeatedPatternParams {
  size_t point_count = 100;
  size_t min_pattern_size = 2;
  size_t max_pattern_size = 8;
  size_t max_repetitions = 4;
  int value_min = 0;       ///< Inclusive lower bound for coordinates.
  int value_max = 100000;  ///< Exclusive upper bound for coordinates.
  uint32_t seed = 1;
};

/// @brief Points made of random patterns, each repeated as translated copies.
///
/// Integral coordinates only. Duplicates produced by overlapping copies are
/// replaced with fresh random points, so exactly point_count distinct points
/// are returned (in generation order). Deterministic for a given seed.
///
/// The count is capped at (value_max - value_min)^2, the number of distinct
/// grid points; an empty range (value_max <= value_min) yields no points.
std::vector<Point> randomRepeatedPatterns(const RepeatedPatternParams& params);

/// @brief n equidistant points on the onset axis: (0, 0), (1, 0), ...
std::vector<Point> pointsOnLine(size_t count);

/// @brief n points whose pairwise difference vectors are all distinct.
///
/// Point i is (i, y_i) with y_i = y_{i-1} + i * 0.01, so no pattern of size
/// greater than one repeats.
std::vector<Point> pointsWithoutRepetition(size_t count);

}  // namespace generator
}  // namespace repat

#endif  // REPAT_CORE_POINT_SET_GENERATOR_H
