// Point and vector formatting and construction helpers.

#include "core/point.h"

#include <cstdio>

namespace repat {

namespace {

std::string formatPair(const Onset& onset, double pitch) {
  char pitch_buf[32];
  std::snprintf(pitch_buf, sizeof(pitch_buf), "%g", pitch);
  return "(" + formatOnset(onset) + ", " + pitch_buf + ")";
}

}  // namespace

std::string Vector::toString() const { return formatPair(onset, pitch); }

std::string Point::toString() const { return formatPair(onset, pitch); }

Point makePoint(double onset, double pitch) {
  return Point(onsetFromDouble(onset), pitch);
}

Vector makeVector(double onset, double pitch) {
  return Vector(onsetFromDouble(onset), pitch);
}

}  // namespace repat
