/// @file
/// @brief Anchor-based exact pattern matching.

#include "search/exact_matcher.h"

namespace repat {

namespace {

/// @brief Check that every query point past the anchor lands in the set.
bool placesAllPoints(const Pattern& query, const PointSet& point_set, const Vector& translation) {
  for (size_t idx = 1; idx < query.size(); ++idx) {
    if (!point_set.contains(query[idx] + translation)) return false;
  }
  return true;
}

}  // namespace

std::vector<Vector> findTranslators(const Pattern& query, const PointSet& point_set) {
  std::vector<Vector> translators;
  if (query.empty()) return translators;

  const Point& anchor = query.front();
  for (const auto& target : point_set) {
    Vector candidate = target - anchor;
    if (placesAllPoints(query, point_set, candidate)) {
      translators.push_back(candidate);
    }
  }
  return translators;
}

MatchStatus findOccurrences(const Pattern& query, const PointSet& point_set,
                            const OccurrenceSink& sink) {
  MatchStatus status;
  if (!validatePattern(query.points(), status.error_message)) {
    status.error_message = "invalid query: " + status.error_message;
    return status;
  }

  const Point& anchor = query.front();
  for (const auto& target : point_set) {
    Vector candidate = target - anchor;
    if (!placesAllPoints(query, point_set, candidate)) continue;
    sink(query.translate(candidate));
    ++status.occurrence_count;
  }

  status.success = true;
  return status;
}

std::vector<Pattern> findOccurrences(const Pattern& query, const PointSet& point_set) {
  std::vector<Pattern> occurrences;
  MatchStatus status = findOccurrences(
      query, point_set, [&occurrences](const Pattern& occurrence) { occurrences.push_back(occurrence); });
  if (!status.success) occurrences.clear();
  return occurrences;
}

}  // namespace repat
