// Repeated-pattern evaluation metrics (MIREX "Discovery of Repeated Themes
// & Sections" establishment scores) for comparing discovered patterns with
// annotated ones.

#ifndef REPAT_ANALYSIS_MIREX_METRICS_H
#define REPAT_ANALYSIS_MIREX_METRICS_H

#include <cstddef>
#include <vector>

#include "core/pattern.h"
#include "core/tec.h"

namespace repat {
namespace mirex {

/// @brief A pattern with its occurrences; index 0 is the pattern itself.
struct PatternOccurrences {
  Pattern pattern;
  std::vector<Pattern> occurrences;

  size_t size() const { return occurrences.size() + 1; }
  const Pattern& operator[](size_t idx) const {
    return idx == 0 ? pattern : occurrences[idx - 1];
  }
};

/// Row-major matrix of scores.
struct ScoreMatrix {
  size_t rows = 0;
  size_t cols = 0;
  std::vector<double> values;

  double at(size_t row, size_t col) const { return values[row * cols + col]; }
};

/// @brief Convert a TEC to pattern + occurrences (the zero-translator copy
/// of the pattern is not repeated among the occurrences).
PatternOccurrences toPatternOccurrences(const Tec& tec);

/// @brief |a ∩ b| / max(|a|, |b|), comparing points as sets.
/// @return Score in [0, 1]; 0 when both patterns are empty.
double cardinalityScore(const Pattern& ground_truth, const Pattern& found);

/// @brief Cardinality score of every (ground-truth occurrence, found
/// occurrence) pair, pattern included at index 0 on both axes.
ScoreMatrix scoreMatrix(const PatternOccurrences& ground_truth, const PatternOccurrences& found);

/// @brief Best occurrence-pair score for each (ground-truth, found) pattern.
ScoreMatrix establishmentMatrix(const std::vector<PatternOccurrences>& ground_truth,
                                const std::vector<PatternOccurrences>& found);

/// @brief Mean over found patterns of their best establishment score.
double establishmentPrecision(const ScoreMatrix& est);

/// @brief Mean over ground-truth patterns of their best establishment score.
double establishmentRecall(const ScoreMatrix& est);

/// @brief Harmonic mean of precision and recall (0 when both are 0).
double f1Score(double precision, double recall);

}  // namespace mirex
}  // namespace repat

#endif  // REPAT_ANALYSIS_MIREX_METRICS_H
