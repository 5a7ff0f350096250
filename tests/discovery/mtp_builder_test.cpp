// Tests for discovery/mtp_builder.h -- local vectors, candidates and MTPs.

#include "discovery/mtp_builder.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace repat {
namespace {

using test_helpers::makePattern;
using test_helpers::makePointSet;
using test_helpers::motifPointSet;

TEST(MtpBuilderTest, LocalIndexRespectsBound) {
  PointSet point_set = motifPointSet();
  LocalVectorIndex index = buildLocalVectorIndex(point_set, Onset(2));
  ASSERT_EQ(index.size(), 1u);
  auto found = index.find(makeVector(1, 2));
  ASSERT_NE(found, index.end());
  EXPECT_EQ(found->second, (std::vector<size_t>{0, 2}));
}

TEST(MtpBuilderTest, LocalIndexBoundIsInclusive) {
  PointSet point_set = motifPointSet();
  LocalVectorIndex index = buildLocalVectorIndex(point_set, Onset(4));
  EXPECT_EQ(index.count(makeVector(4, 0)), 1u);
  EXPECT_EQ(index.count(makeVector(3, -2)), 1u);
  EXPECT_EQ(index.count(makeVector(5, 2)), 0u);
}

TEST(MtpBuilderTest, LocalIndexIncludesSimultaneousPoints) {
  PointSet point_set = makePointSet({{0, 60}, {0, 64}, {2, 60}, {2, 64}});
  LocalVectorIndex index = buildLocalVectorIndex(point_set, Onset(0));
  ASSERT_EQ(index.size(), 1u);
  EXPECT_EQ(index.begin()->first, makeVector(0, 4));
  EXPECT_EQ(index.begin()->second, (std::vector<size_t>{0, 2}));
}

TEST(MtpBuilderTest, ZeroBoundOnMonophonicInputIsEmpty) {
  EXPECT_TRUE(buildLocalVectorIndex(motifPointSet(), Onset(0)).empty());
  EXPECT_TRUE(computeMtps(motifPointSet(), Onset(0)).empty());
}

TEST(MtpBuilderTest, CandidatesIncludeRecurrenceDistance) {
  PointSet point_set = motifPointSet();
  LocalVectorIndex index = buildLocalVectorIndex(point_set, Onset(2));
  std::vector<Vector> candidates = candidateTranslators(point_set, index);
  ASSERT_EQ(candidates.size(), 2u);
  EXPECT_EQ(candidates[0], makeVector(1, 2));
  EXPECT_EQ(candidates[1], makeVector(4, 0));
}

TEST(MtpBuilderTest, MaximalTranslatablePattern) {
  PointSet point_set = motifPointSet();
  EXPECT_EQ(maximalTranslatablePattern(point_set, makeVector(4, 0)),
            makePattern({{0, 60}, {1, 62}}));
  EXPECT_EQ(maximalTranslatablePattern(point_set, makeVector(1, 2)),
            makePattern({{0, 60}, {4, 60}}));
  EXPECT_TRUE(maximalTranslatablePattern(point_set, makeVector(2, 0)).empty());
}

TEST(MtpBuilderTest, MaximalTranslatablePatternOnLine) {
  PointSet point_set = makePointSet({{0, 0}, {1, 0}, {2, 0}, {3, 0}});
  EXPECT_EQ(maximalTranslatablePattern(point_set, makeVector(1, 0)),
            makePattern({{0, 0}, {1, 0}, {2, 0}}));
  EXPECT_EQ(maximalTranslatablePattern(point_set, makeVector(3, 0)), makePattern({{0, 0}}));
}

TEST(MtpBuilderTest, ComputeMtpsFollowsCandidateOrder) {
  std::vector<Mtp> mtps = computeMtps(motifPointSet(), Onset(2));
  ASSERT_EQ(mtps.size(), 2u);
  EXPECT_EQ(mtps[0].translator, makeVector(1, 2));
  EXPECT_EQ(mtps[0].pattern.size(), 2u);
  EXPECT_EQ(mtps[1].translator, makeVector(4, 0));
  EXPECT_EQ(mtps[1].pattern, makePattern({{0, 60}, {1, 62}}));
}

TEST(MtpBuilderTest, PatternTranslatorsUseLocalSources) {
  PointSet point_set = motifPointSet();
  LocalVectorIndex index = buildLocalVectorIndex(point_set, Onset(2));
  size_t tried = 0;
  std::vector<Vector> translators =
      patternTranslators(makePattern({{0, 60}, {1, 62}}), point_set, index, tried);
  EXPECT_EQ(translators, (std::vector<Vector>{Vector(), makeVector(4, 0)}));
  // Only the two sources of (1, 2) are tried.
  EXPECT_EQ(tried, 2u);
}

TEST(MtpBuilderTest, PatternTranslatorsWithoutClosePairScanTheSet) {
  PointSet point_set = motifPointSet();
  LocalVectorIndex index = buildLocalVectorIndex(point_set, Onset(2));
  size_t tried = 0;
  std::vector<Vector> translators =
      patternTranslators(makePattern({{0, 60}, {4, 60}}), point_set, index, tried);
  EXPECT_EQ(translators, (std::vector<Vector>{Vector(), makeVector(1, 2)}));
  EXPECT_EQ(tried, 4u);

  tried = 0;
  EXPECT_EQ(patternTranslators(makePattern({{1, 62}}), point_set, index, tried).size(), 4u);
  EXPECT_TRUE(patternTranslators(Pattern(), point_set, index, tried).empty());
}

TEST(MtpBuilderTest, PatternTranslatorsPickRarestLocalVector) {
  // (1, 0) starts four times, (1, 5) once.
  PointSet point_set = makePointSet({{0, 60}, {1, 60}, {2, 60}, {3, 60}, {4, 60}, {5, 65}});
  LocalVectorIndex index = buildLocalVectorIndex(point_set, Onset(1));
  size_t tried = 0;
  std::vector<Vector> translators =
      patternTranslators(makePattern({{3, 60}, {4, 60}, {5, 65}}), point_set, index, tried);
  EXPECT_EQ(translators, (std::vector<Vector>{Vector()}));
  EXPECT_EQ(tried, 1u);
}

TEST(MtpBuilderTest, FractionalOnsets) {
  PointSet point_set = makePointSet({{0, 60}, {0.5, 62}, {3, 60}, {3.5, 62}});
  std::vector<Mtp> mtps = computeMtps(point_set, Onset(1, 2));
  ASSERT_EQ(mtps.size(), 2u);
  EXPECT_EQ(mtps[0].translator, Vector(Onset(1, 2), 2.0));
  EXPECT_EQ(mtps[1].translator, makeVector(3, 0));
  EXPECT_EQ(mtps[1].pattern, makePattern({{0, 60}, {0.5, 62}}));
}

}  // namespace
}  // namespace repat
