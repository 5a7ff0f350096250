/// @file
/// @brief Deterministic synthetic point-set generators.

#include "core/point_set_generator.h"

#include <algorithm>
#include <random>
#include <set>

namespace repat {
namespace generator {

namespace {

/// @brief Random integer in [min, max] inclusive.
int rollRange(std::mt19937& rng, int min, int max) {
  std::uniform_int_distribution<int> dist(min, max);
  return dist(rng);
}

Point randomPoint(std::mt19937& rng, const RepeatedPatternParams& params) {
  return Point(Onset(rollRange(rng, params.value_min, params.value_max - 1)),
               static_cast<double>(rollRange(rng, params.value_min, params.value_max - 1)));
}

}  // namespace

std::vector<Point> randomRepeatedPatterns(const RepeatedPatternParams& params) {
  std::vector<Point> points;
  if (params.value_max <= params.value_min) return points;

  // The grid holds only span^2 distinct points.
  const uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(params.value_max) -
                                              static_cast<int64_t>(params.value_min));
  const size_t point_count =
      static_cast<size_t>(std::min<uint64_t>(params.point_count, span * span));

  std::mt19937 rng(params.seed);
  points.reserve(point_count);

  size_t min_size = std::max<size_t>(1, params.min_pattern_size);
  size_t max_size = std::max(min_size, params.max_pattern_size);
  size_t max_reps = std::max<size_t>(1, params.max_repetitions);

  while (points.size() < point_count) {
    size_t remaining = point_count - points.size();
    size_t pattern_size = static_cast<size_t>(
        rollRange(rng, static_cast<int>(min_size), static_cast<int>(max_size)));
    pattern_size = std::min(pattern_size, remaining);

    std::vector<Point> pattern;
    pattern.reserve(pattern_size);
    for (size_t idx = 0; idx < pattern_size; ++idx) {
      pattern.push_back(randomPoint(rng, params));
    }
    points.insert(points.end(), pattern.begin(), pattern.end());

    int repetitions = rollRange(rng, 1, static_cast<int>(max_reps));
    for (int rep = 0; rep < repetitions; ++rep) {
      if (points.size() + pattern_size > point_count) break;
      Vector shift(Onset(rollRange(rng, params.value_min, params.value_max - 1)),
                   static_cast<double>(rollRange(rng, params.value_min, params.value_max - 1)));
      for (const auto& point : pattern) {
        points.push_back(point + shift);
      }
    }
  }

  // Replace duplicates so the caller gets exactly point_count distinct points.
  std::set<Point> seen;
  for (auto& point : points) {
    while (!seen.insert(point).second) {
      point = randomPoint(rng, params);
    }
  }
  return points;
}

std::vector<Point> pointsOnLine(size_t count) {
  std::vector<Point> points;
  points.reserve(count);
  for (size_t idx = 0; idx < count; ++idx) {
    points.emplace_back(Onset(static_cast<int64_t>(idx)), 0.0);
  }
  return points;
}

std::vector<Point> pointsWithoutRepetition(size_t count) {
  std::vector<Point> points;
  points.reserve(count);
  double pitch = 0.0;
  for (size_t idx = 0; idx < count; ++idx) {
    pitch += static_cast<double>(idx) * 0.01;
    points.emplace_back(Onset(static_cast<int64_t>(idx)), pitch);
  }
  return points;
}

}  // namespace generator
}  // namespace repat
