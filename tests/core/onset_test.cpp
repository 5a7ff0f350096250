// Tests for core/onset.h -- exact onset conversion.

#include "core/onset.h"

#include <gtest/gtest.h>

#include <cmath>

namespace repat {
namespace {

TEST(OnsetTest, IntegralValuesConvertExactly) {
  EXPECT_EQ(onsetFromDouble(0.0), Onset(0));
  EXPECT_EQ(onsetFromDouble(4.0), Onset(4));
  EXPECT_EQ(onsetFromDouble(-12.0), Onset(-12));
  EXPECT_EQ(onsetFromDouble(1920.0), Onset(1920));
}

TEST(OnsetTest, DyadicValuesConvertExactly) {
  EXPECT_EQ(onsetFromDouble(0.5), Onset(1, 2));
  EXPECT_EQ(onsetFromDouble(0.75), Onset(3, 4));
  EXPECT_EQ(onsetFromDouble(-2.5), Onset(-5, 2));
  EXPECT_EQ(onsetFromDouble(10.0625), Onset(161, 16));
}

TEST(OnsetTest, TripletPositionsRecoverThirds) {
  EXPECT_EQ(onsetFromDouble(1.0 / 3.0), Onset(1, 3));
  EXPECT_EQ(onsetFromDouble(2.0 / 3.0), Onset(2, 3));
  EXPECT_EQ(onsetFromDouble(4.0 + 1.0 / 3.0), Onset(13, 3));
  EXPECT_EQ(onsetFromDouble(1.0 / 6.0), Onset(1, 6));
}

TEST(OnsetTest, ThirdsSumWithoutDrift) {
  Onset third = onsetFromDouble(1.0 / 3.0);
  EXPECT_EQ(third + third + third, Onset(1));
}

TEST(OnsetTest, DenominatorIsBounded) {
  const double pi = std::acos(-1.0);
  Onset approx = onsetFromDouble(pi, 1e-15, 1000);
  EXPECT_LE(approx.denominator(), 1000);
  EXPECT_NEAR(onsetToDouble(approx), pi, 1e-6);
}

TEST(OnsetTest, RoundedDecimalStaysWithinTolerance) {
  // Five-decimal rounding of 1/3 is a different onset than 1/3 itself.
  Onset rounded = onsetFromDouble(0.33333);
  EXPECT_NE(rounded, Onset(1, 3));
  EXPECT_NEAR(onsetToDouble(rounded), 0.33333, 1e-9);
}

TEST(OnsetTest, ToDouble) {
  EXPECT_DOUBLE_EQ(onsetToDouble(Onset(7, 2)), 3.5);
  EXPECT_DOUBLE_EQ(onsetToDouble(Onset(-1, 4)), -0.25);
}

TEST(OnsetTest, FormatOnset) {
  EXPECT_EQ(formatOnset(Onset(3)), "3");
  EXPECT_EQ(formatOnset(Onset(-5, 2)), "-5/2");
  EXPECT_EQ(formatOnset(Onset(2, 6)), "1/3");
}

}  // namespace
}  // namespace repat
