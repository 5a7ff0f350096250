// Maximal translatable pattern (MTP) computation driven by bounded local
// difference vectors.

#ifndef REPAT_DISCOVERY_MTP_BUILDER_H
#define REPAT_DISCOVERY_MTP_BUILDER_H

#include <cstddef>
#include <map>
#include <vector>

#include "core/onset.h"
#include "core/pattern.h"
#include "core/point.h"
#include "core/point_set.h"

namespace repat {

/// @brief Maximal translatable pattern for one translator.
///
/// pattern holds every point p of the set (ascending) with p + translator
/// also in the set. Transient: consumed by TEC consolidation.
struct Mtp {
  Vector translator;
  Pattern pattern;
};

/// Local vector -> ascending indices of the points it starts from.
using LocalVectorIndex = std::map<Vector, std::vector<size_t>>;

/// @brief Forward difference vectors between points at most max_ioi apart.
///
/// For each point p in ascending order, walks the following points q while
/// q.onset - p.onset <= max_ioi and files p under q - p. Costs O(n * k) map
/// insertions for k points per max_ioi window instead of all n^2 pairs.
///
/// @param point_set Source point set.
/// @param max_ioi Non-negative onset bound.
/// @return Ordered index from local vector to its source points.
LocalVectorIndex buildLocalVectorIndex(const PointSet& point_set, const Onset& max_ioi);

/// @brief Translators worth expanding into MTPs.
///
/// Two kinds are collected:
///   - every local vector itself (its MTP is exactly its source list), and
///   - every difference p_b - p_a between two sources a < b of the same local
///     vector d: the pair {p_a, p_a + d} recurs at {p_b, p_b + d}.
/// The second kind reaches translators of any size, as long as the repeated
/// material contains two points no more than max_ioi apart.
///
/// @param point_set Source point set.
/// @param local_index Output of buildLocalVectorIndex() for @p point_set.
/// @return Distinct translators in ascending order (all greater than zero).
std::vector<Vector> candidateTranslators(const PointSet& point_set,
                                         const LocalVectorIndex& local_index);

/// @brief Every point p of the set with p + translator also in the set.
///
/// Single merge pass over the sorted storage, O(n).
Pattern maximalTranslatablePattern(const PointSet& point_set, const Vector& translator);

/// @brief Every translation that maps @p pattern entirely into @p point_set.
///
/// @p pattern must be a subset of @p point_set. When two consecutive pattern
/// points p_a, p_b are filed in @p local_index, only the sources s of
/// p_b - p_a can be images of p_a, so the candidates are s - p_a; of all such
/// pairs the one with the fewest sources is used. Patterns without such a
/// pair (single points, or points spread wider than the bound) fall back to
/// trying every point of the set as the image of the first pattern point.
///
/// @param pattern Pattern to place.
/// @param point_set Source point set.
/// @param local_index Output of buildLocalVectorIndex() for @p point_set.
/// @param candidate_count Incremented by the number of translations tried.
/// @return Translators in ascending order, zero vector included.
std::vector<Vector> patternTranslators(const Pattern& pattern, const PointSet& point_set,
                                       const LocalVectorIndex& local_index,
                                       size_t& candidate_count);

/// @brief All MTPs for the candidate translators, in ascending translator order.
///
/// Bulk helper; discovery expands candidates one at a time instead.
std::vector<Mtp> computeMtps(const PointSet& point_set, const Onset& max_ioi);

}  // namespace repat

#endif  // REPAT_DISCOVERY_MTP_BUILDER_H
