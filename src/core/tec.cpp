// TEC expansion helpers.

#include "core/tec.h"

#include <algorithm>

namespace repat {

std::vector<Pattern> Tec::occurrences() const {
  std::vector<Pattern> result;
  result.reserve(translators.size());
  for (const auto& translator : translators) {
    result.push_back(pattern.translate(translator));
  }
  return result;
}

std::vector<Point> Tec::coveredPoints() const {
  std::vector<Point> covered;
  covered.reserve(pattern.size() * translators.size());
  for (const auto& translator : translators) {
    for (const auto& point : pattern) {
      covered.push_back(point + translator);
    }
  }
  std::sort(covered.begin(), covered.end());
  covered.erase(std::unique(covered.begin(), covered.end()), covered.end());
  return covered;
}

bool Tec::isSoundFor(const PointSet& point_set) const {
  for (const auto& translator : translators) {
    for (const auto& point : pattern) {
      if (!point_set.contains(point + translator)) return false;
    }
  }
  return true;
}

}  // namespace repat
