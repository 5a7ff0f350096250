// Tests for analysis/mirex_metrics.h -- establishment precision/recall.

#include "analysis/mirex_metrics.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace repat {
namespace mirex {
namespace {

using test_helpers::makePattern;

Pattern patternA() { return makePattern({{1.0, 2.0}, {2.0, 2.0}, {3.0, 4.0}}); }

Pattern patternB() { return makePattern({{1.5, 2.0}, {2.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}}); }

/// Pattern plus copies shifted by (10k, 2) for k = 1..copies.
PatternOccurrences withShiftedCopies(const Pattern& pattern, int copies) {
  PatternOccurrences result;
  result.pattern = pattern;
  for (int copy = 1; copy <= copies; ++copy) {
    result.occurrences.push_back(pattern.translate(makeVector(10.0 * copy, 2.0)));
  }
  return result;
}

PatternOccurrences occA() { return withShiftedCopies(patternA(), 2); }
PatternOccurrences occB() { return withShiftedCopies(patternB(), 3); }

TEST(MirexMetricsTest, CardinalityScore) {
  EXPECT_DOUBLE_EQ(cardinalityScore(patternA(), patternB()), 0.5);
  EXPECT_DOUBLE_EQ(cardinalityScore(patternA(), patternA()), 1.0);
  EXPECT_DOUBLE_EQ(cardinalityScore(Pattern(), Pattern()), 0.0);
}

TEST(MirexMetricsTest, CardinalityIgnoresOrder) {
  Pattern reversed = makePattern({{3.0, 4.0}, {2.0, 2.0}, {1.0, 2.0}});
  EXPECT_DOUBLE_EQ(cardinalityScore(patternA(), reversed), 1.0);
}

TEST(MirexMetricsTest, ScoreMatrixWithSelfIsIdentity) {
  ScoreMatrix scores = scoreMatrix(occA(), occA());
  ASSERT_EQ(scores.rows, 3u);
  ASSERT_EQ(scores.cols, 3u);
  for (size_t row = 0; row < 3; ++row) {
    for (size_t col = 0; col < 3; ++col) {
      EXPECT_DOUBLE_EQ(scores.at(row, col), row == col ? 1.0 : 0.0);
    }
  }
}

TEST(MirexMetricsTest, ScoreMatrixWithAnotherPattern) {
  ScoreMatrix scores = scoreMatrix(occA(), occB());
  ASSERT_EQ(scores.rows, 3u);
  ASSERT_EQ(scores.cols, 4u);
  for (size_t row = 0; row < 3; ++row) {
    for (size_t col = 0; col < 4; ++col) {
      EXPECT_DOUBLE_EQ(scores.at(row, col), row == col ? 0.5 : 0.0);
    }
  }
}

TEST(MirexMetricsTest, EstablishmentMatrix) {
  std::vector<PatternOccurrences> found = {occA(), occA()};
  ScoreMatrix self = establishmentMatrix(found, found);
  ASSERT_EQ(self.rows, 2u);
  ASSERT_EQ(self.cols, 2u);
  for (double value : self.values) EXPECT_DOUBLE_EQ(value, 1.0);

  std::vector<PatternOccurrences> ground_truth = {occA(), occB(), occB()};
  ScoreMatrix est = establishmentMatrix(ground_truth, found);
  ASSERT_EQ(est.rows, 3u);
  EXPECT_EQ(est.values, (std::vector<double>{1.0, 1.0, 0.5, 0.5, 0.5, 0.5}));
}

TEST(MirexMetricsTest, EstablishmentPrecision) {
  std::vector<PatternOccurrences> found = {occA(), occA()};
  EXPECT_DOUBLE_EQ(establishmentPrecision(establishmentMatrix(found, found)), 1.0);

  std::vector<PatternOccurrences> ground_truth = {occB(), occB(), occB()};
  EXPECT_DOUBLE_EQ(establishmentPrecision(establishmentMatrix(ground_truth, found)), 0.5);
}

TEST(MirexMetricsTest, EstablishmentRecall) {
  std::vector<PatternOccurrences> found = {occA(), occA()};
  EXPECT_DOUBLE_EQ(establishmentRecall(establishmentMatrix(found, found)), 1.0);

  std::vector<PatternOccurrences> ground_truth = {occA(), occB(), occB()};
  EXPECT_DOUBLE_EQ(establishmentRecall(establishmentMatrix(ground_truth, found)), 2.0 / 3.0);
}

TEST(MirexMetricsTest, F1Score) {
  EXPECT_DOUBLE_EQ(f1Score(1.0, 1.0), 1.0);
  EXPECT_DOUBLE_EQ(f1Score(1.0, 2.0 / 3.0), 2.0 * (2.0 / 3.0) / (1.0 + 2.0 / 3.0));
  EXPECT_DOUBLE_EQ(f1Score(0.0, 0.0), 0.0);
}

TEST(MirexMetricsTest, EmptyListsScoreZero) {
  ScoreMatrix est = establishmentMatrix({}, {occA()});
  EXPECT_EQ(est.rows, 0u);
  EXPECT_DOUBLE_EQ(establishmentPrecision(est), 0.0);
  EXPECT_DOUBLE_EQ(establishmentRecall(est), 0.0);
}

TEST(MirexMetricsTest, TecConversionSkipsIdentity) {
  Tec tec;
  tec.pattern = patternA();
  tec.translators = {Vector(), makeVector(10, 2), makeVector(20, 2)};
  PatternOccurrences converted = toPatternOccurrences(tec);
  ASSERT_EQ(converted.size(), 3u);
  EXPECT_EQ(converted[0], patternA());
  EXPECT_EQ(converted[1], occA()[1]);
  EXPECT_EQ(converted[2], occA()[2]);
}

TEST(MirexMetricsTest, DiscoveredTecScoresAgainstItself) {
  Tec tec;
  tec.pattern = patternA();
  tec.translators = {Vector(), makeVector(10, 2)};
  std::vector<PatternOccurrences> found = {toPatternOccurrences(tec)};
  ScoreMatrix est = establishmentMatrix(found, found);
  EXPECT_DOUBLE_EQ(f1Score(establishmentPrecision(est), establishmentRecall(est)), 1.0);
}

}  // namespace
}  // namespace mirex
}  // namespace repat
