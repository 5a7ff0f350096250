/// @file
/// @brief Local-vector indexing and MTP expansion.

#include "discovery/mtp_builder.h"

#include <set>
#include <utility>

namespace repat {

namespace {

/// @brief True if every pattern point outside [known_begin, known_end) lands
/// in the set under @p translation. The last point is checked first.
bool coversPattern(const Pattern& pattern, const PointSet& point_set, const Vector& translation,
                   size_t known_begin, size_t known_end) {
  const size_t last = pattern.size() - 1;
  auto known = [&](size_t idx) { return idx >= known_begin && idx < known_end; };

  if (!known(last) && !point_set.contains(pattern[last] + translation)) return false;
  for (size_t idx = 0; idx < last; ++idx) {
    if (known(idx)) continue;
    if (!point_set.contains(pattern[idx] + translation)) return false;
  }
  return true;
}

}  // namespace

LocalVectorIndex buildLocalVectorIndex(const PointSet& point_set, const Onset& max_ioi) {
  LocalVectorIndex index;

  const size_t count = point_set.size();
  for (size_t from = 0; from < count; ++from) {
    const Point& origin = point_set[from];
    for (size_t to = from + 1; to < count; ++to) {
      Vector diff = point_set[to] - origin;
      if (diff.onset > max_ioi) break;
      index[diff].push_back(from);
    }
  }
  return index;
}

std::vector<Vector> candidateTranslators(const PointSet& point_set,
                                         const LocalVectorIndex& local_index) {
  std::set<Vector> candidates;
  for (const auto& entry : local_index) {
    candidates.insert(entry.first);

    const std::vector<size_t>& sources = entry.second;
    for (size_t first = 0; first < sources.size(); ++first) {
      for (size_t second = first + 1; second < sources.size(); ++second) {
        candidates.insert(point_set[sources[second]] - point_set[sources[first]]);
      }
    }
  }
  return std::vector<Vector>(candidates.begin(), candidates.end());
}

Pattern maximalTranslatablePattern(const PointSet& point_set, const Vector& translator) {
  std::vector<Point> sources;

  // p + translator is monotone in p, so one forward cursor suffices.
  size_t cursor = 0;
  const size_t count = point_set.size();
  for (size_t idx = 0; idx < count && cursor < count; ++idx) {
    Point target = point_set[idx] + translator;
    while (cursor < count && point_set[cursor] < target) ++cursor;
    if (cursor < count && point_set[cursor] == target) {
      sources.push_back(point_set[idx]);
    }
  }
  return Pattern(std::move(sources));
}

std::vector<Vector> patternTranslators(const Pattern& pattern, const PointSet& point_set,
                                       const LocalVectorIndex& local_index,
                                       size_t& candidate_count) {
  std::vector<Vector> translators;
  if (pattern.empty()) return translators;

  const std::vector<size_t>* best_sources = nullptr;
  size_t best_first = 0;
  for (size_t idx = 0; idx + 1 < pattern.size(); ++idx) {
    auto found = local_index.find(pattern[idx + 1] - pattern[idx]);
    if (found == local_index.end()) continue;
    if (best_sources == nullptr || found->second.size() < best_sources->size()) {
      best_sources = &found->second;
      best_first = idx;
    }
  }

  if (best_sources == nullptr) {
    const Point& anchor = pattern.front();
    candidate_count += point_set.size();
    for (const auto& target : point_set) {
      Vector candidate = target - anchor;
      if (coversPattern(pattern, point_set, candidate, 0, 1)) translators.push_back(candidate);
    }
    return translators;
  }

  // Sources are ascending, so the candidates are too.
  const Point& anchor = pattern[best_first];
  candidate_count += best_sources->size();
  for (size_t source : *best_sources) {
    Vector candidate = point_set[source] - anchor;
    if (coversPattern(pattern, point_set, candidate, best_first, best_first + 1)) {
      translators.push_back(candidate);
    }
  }
  return translators;
}

std::vector<Mtp> computeMtps(const PointSet& point_set, const Onset& max_ioi) {
  LocalVectorIndex local_index = buildLocalVectorIndex(point_set, max_ioi);
  std::vector<Vector> translators = candidateTranslators(point_set, local_index);

  std::vector<Mtp> mtps;
  mtps.reserve(translators.size());
  for (const auto& translator : translators) {
    mtps.push_back(Mtp{translator, maximalTranslatablePattern(point_set, translator)});
  }
  return mtps;
}

}  // namespace repat
