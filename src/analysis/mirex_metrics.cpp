/// @file
/// @brief Establishment precision/recall for repeated-pattern evaluation.

#include "analysis/mirex_metrics.h"

#include <algorithm>
#include <iterator>

namespace repat {
namespace mirex {

namespace {

/// @brief Sorted, de-duplicated copy of a pattern's points.
std::vector<Point> sortedPoints(const Pattern& pattern) {
  std::vector<Point> points = pattern.points();
  std::sort(points.begin(), points.end());
  points.erase(std::unique(points.begin(), points.end()), points.end());
  return points;
}

}  // namespace

PatternOccurrences toPatternOccurrences(const Tec& tec) {
  PatternOccurrences result;
  result.pattern = tec.pattern;
  for (const auto& translator : tec.translators) {
    if (translator.isZero()) continue;
    result.occurrences.push_back(tec.pattern.translate(translator));
  }
  return result;
}

double cardinalityScore(const Pattern& ground_truth, const Pattern& found) {
  std::vector<Point> gt_points = sortedPoints(ground_truth);
  std::vector<Point> found_points = sortedPoints(found);
  size_t larger = std::max(gt_points.size(), found_points.size());
  if (larger == 0) return 0.0;

  std::vector<Point> common;
  std::set_intersection(gt_points.begin(), gt_points.end(), found_points.begin(),
                        found_points.end(), std::back_inserter(common));
  return static_cast<double>(common.size()) / static_cast<double>(larger);
}

ScoreMatrix scoreMatrix(const PatternOccurrences& ground_truth, const PatternOccurrences& found) {
  ScoreMatrix scores;
  scores.rows = ground_truth.size();
  scores.cols = found.size();
  scores.values.assign(scores.rows * scores.cols, 0.0);

  for (size_t row = 0; row < scores.rows; ++row) {
    for (size_t col = 0; col < scores.cols; ++col) {
      scores.values[row * scores.cols + col] = cardinalityScore(ground_truth[row], found[col]);
    }
  }
  return scores;
}

ScoreMatrix establishmentMatrix(const std::vector<PatternOccurrences>& ground_truth,
                                const std::vector<PatternOccurrences>& found) {
  ScoreMatrix est;
  est.rows = ground_truth.size();
  est.cols = found.size();
  est.values.assign(est.rows * est.cols, 0.0);

  for (size_t row = 0; row < est.rows; ++row) {
    for (size_t col = 0; col < est.cols; ++col) {
      ScoreMatrix scores = scoreMatrix(ground_truth[row], found[col]);
      est.values[row * est.cols + col] =
          *std::max_element(scores.values.begin(), scores.values.end());
    }
  }
  return est;
}

double establishmentPrecision(const ScoreMatrix& est) {
  if (est.rows == 0 || est.cols == 0) return 0.0;
  double total = 0.0;
  for (size_t col = 0; col < est.cols; ++col) {
    double best = 0.0;
    for (size_t row = 0; row < est.rows; ++row) best = std::max(best, est.at(row, col));
    total += best;
  }
  return total / static_cast<double>(est.cols);
}

double establishmentRecall(const ScoreMatrix& est) {
  if (est.rows == 0 || est.cols == 0) return 0.0;
  double total = 0.0;
  for (size_t row = 0; row < est.rows; ++row) {
    double best = 0.0;
    for (size_t col = 0; col < est.cols; ++col) best = std::max(best, est.at(row, col));
    total += best;
  }
  return total / static_cast<double>(est.rows);
}

double f1Score(double precision, double recall) {
  if (precision + recall <= 0.0) return 0.0;
  return 2.0 * precision * recall / (precision + recall);
}

}  // namespace mirex
}  // namespace repat
