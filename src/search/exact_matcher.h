// Exact (translation-only) occurrence search for a query pattern.

#ifndef REPAT_SEARCH_EXACT_MATCHER_H
#define REPAT_SEARCH_EXACT_MATCHER_H

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/pattern.h"
#include "core/point.h"
#include "core/point_set.h"

namespace repat {

/// Receives each occurrence as soon as it is verified. Called synchronously
/// on the searching thread; must not modify the pattern it is given.
using OccurrenceSink = std::function<void(const Pattern&)>;

/// @brief Outcome of a sink-based occurrence search.
struct MatchStatus {
  bool success = false;
  std::string error_message;
  size_t occurrence_count = 0;
};

/// @brief Every translation that maps @p query entirely into @p point_set.
///
/// The anchor is the first query point; each point of the set is tried as
/// its image and the candidate is kept only if every other query point lands
/// on a member of the set. Result is ascending (anchor images are visited in
/// set order). The zero vector is included when @p query is itself a subset.
/// An empty query yields no translators.
///
/// @param query Pattern to place.
/// @param point_set Target point set.
/// @return Translators in ascending order.
std::vector<Vector> findTranslators(const Pattern& query, const PointSet& point_set);

/// @brief Emit every exact translated occurrence of @p query in @p point_set.
///
/// The query is validated first (non-empty, distinct, finite); an invalid
/// query fails without calling @p sink. Occurrences keep the query's element
/// order and are emitted in ascending order of their translation.
///
/// @param query Query pattern (need not come from @p point_set).
/// @param point_set Target point set.
/// @param sink Called once per occurrence.
/// @return Status with the number of occurrences emitted.
MatchStatus findOccurrences(const Pattern& query, const PointSet& point_set,
                            const OccurrenceSink& sink);

/// @brief Collecting variant of findOccurrences().
/// @return Occurrences in emission order; empty on invalid query.
std::vector<Pattern> findOccurrences(const Pattern& query, const PointSet& point_set);

}  // namespace repat

#endif  // REPAT_SEARCH_EXACT_MATCHER_H
