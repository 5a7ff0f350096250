/// @file
/// @brief Continued-fraction conversion from real onsets to exact onsets.

#include "core/onset.h"

#include <cmath>

namespace repat {

Onset onsetFromDouble(double value, double tolerance, int64_t max_denominator) {
  if (max_denominator < 1) max_denominator = 1;

  // Convergent recurrences: h_n = a_n * h_{n-1} + h_{n-2}, same for k.
  int64_t h_prev = 1;
  int64_t h_prev2 = 0;
  int64_t k_prev = 0;
  int64_t k_prev2 = 1;

  double remainder = value;
  Onset best(static_cast<int64_t>(std::floor(value)));

  // 64 terms is far beyond what any double needs.
  for (int term = 0; term < 64; ++term) {
    double whole = std::floor(remainder);
    if (std::fabs(whole) > kMaxOnsetMagnitude * 2.0) break;
    int64_t coeff = static_cast<int64_t>(whole);

    if (k_prev > 0 && coeff > (max_denominator - k_prev2) / k_prev) break;
    int64_t numer = coeff * h_prev + h_prev2;
    int64_t denom = coeff * k_prev + k_prev2;
    if (denom > max_denominator) break;

    best = Onset(numer, denom);
    double approx = static_cast<double>(numer) / static_cast<double>(denom);
    if (std::fabs(value - approx) <= tolerance) break;

    double frac = remainder - whole;
    if (frac <= 0.0) break;
    remainder = 1.0 / frac;

    h_prev2 = h_prev;
    h_prev = numer;
    k_prev2 = k_prev;
    k_prev = denom;
  }

  return best;
}

std::string formatOnset(const Onset& onset) {
  if (onset.denominator() == 1) {
    return std::to_string(onset.numerator());
  }
  return std::to_string(onset.numerator()) + "/" + std::to_string(onset.denominator());
}

}  // namespace repat
