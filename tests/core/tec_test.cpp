#include "core/tec.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace repat {
namespace {

using test_helpers::makePattern;

Tec motifTec() {
  Tec tec;
  tec.pattern = makePattern({{0, 60}, {1, 62}});
  tec.translators = {Vector(), makeVector(4, 0)};
  return tec;
}

TEST(TecTest, OccurrencesFollowTranslators) {
  std::vector<Pattern> occurrences = motifTec().occurrences();
  ASSERT_EQ(occurrences.size(), 2u);
  EXPECT_EQ(occurrences[0], makePattern({{0, 60}, {1, 62}}));
  EXPECT_EQ(occurrences[1], makePattern({{4, 60}, {5, 62}}));
}

TEST(TecTest, CoveredPointsAreSortedUnion) {
  Tec tec;
  tec.pattern = makePattern({{0, 60}, {1, 60}});
  tec.translators = {Vector(), makeVector(1, 0)};
  std::vector<Point> covered = tec.coveredPoints();
  ASSERT_EQ(covered.size(), 3u);
  EXPECT_EQ(covered[0], makePoint(0, 60));
  EXPECT_EQ(covered[1], makePoint(1, 60));
  EXPECT_EQ(covered[2], makePoint(2, 60));
}

TEST(TecTest, SoundnessCheck) {
  PointSet point_set = test_helpers::motifPointSet();
  Tec tec = motifTec();
  EXPECT_TRUE(tec.isSoundFor(point_set));

  tec.translators.push_back(makeVector(1, 2));
  EXPECT_FALSE(tec.isSoundFor(point_set));
}

TEST(TecTest, Equality) {
  Tec first = motifTec();
  Tec second = motifTec();
  EXPECT_EQ(first, second);
  second.translators.pop_back();
  EXPECT_NE(first, second);
}

}  // namespace
}  // namespace repat
