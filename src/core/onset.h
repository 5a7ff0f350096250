// Exact onset-time arithmetic for the time axis of point sets.

#ifndef REPAT_CORE_ONSET_H
#define REPAT_CORE_ONSET_H

#include <cstdint>
#include <string>

#include <boost/rational.hpp>

namespace repat {

/// Exact onset time. Differences and sums of onsets never accumulate
/// rounding error, so vector grouping on the time axis is exact.
using Onset = boost::rational<int64_t>;

/// Default absolute tolerance when converting a real onset to a rational.
constexpr double kDefaultOnsetTolerance = 1e-9;

/// Largest denominator produced by onsetFromDouble (2^20).
constexpr int64_t kMaxOnsetDenominator = int64_t{1} << 20;

/// Largest onset magnitude accepted at the ingestion boundary.
constexpr double kMaxOnsetMagnitude = 1e12;

/// @brief Convert a real-valued onset to the simplest nearby rational.
///
/// Walks the continued-fraction convergents of @p value and returns the
/// first one within @p tolerance, or the last one whose denominator does not
/// exceed @p max_denominator. Integral and dyadic values convert exactly,
/// and triplet positions such as 1/3 stored as a double come back as 1/3.
///
/// @param value Finite onset value with |value| <= kMaxOnsetMagnitude.
/// @param tolerance Absolute tolerance for accepting a convergent.
/// @param max_denominator Upper bound on the result denominator.
/// @return Rational onset.
Onset onsetFromDouble(double value, double tolerance = kDefaultOnsetTolerance,
                      int64_t max_denominator = kMaxOnsetDenominator);

/// @brief Convert an onset back to floating point (for output buffers).
inline double onsetToDouble(const Onset& onset) {
  return boost::rational_cast<double>(onset);
}

/// @brief Render an onset as "n" or "n/d".
std::string formatOnset(const Onset& onset);

}  // namespace repat

#endif  // REPAT_CORE_ONSET_H
