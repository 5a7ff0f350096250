// Point and difference-vector value types for (onset, pitch) point sets.

#ifndef REPAT_CORE_POINT_H
#define REPAT_CORE_POINT_H

#include <string>

#include "core/onset.h"

namespace repat {

/// @brief Translation between two points: (onset difference, pitch difference).
///
/// Used both geometrically and as a map key. Ordering is lexicographic
/// (onset first, then pitch); pitch compares with strict floating equality.
struct Vector {
  Onset onset{0};
  double pitch = 0.0;

  Vector() = default;
  Vector(Onset onset_value, double pitch_value) : onset(onset_value), pitch(pitch_value) {}

  /// @brief True for the identity translation.
  bool isZero() const { return onset == 0 && pitch == 0.0; }

  Vector operator+(const Vector& other) const {
    return Vector(onset + other.onset, pitch + other.pitch);
  }
  Vector operator-(const Vector& other) const {
    return Vector(onset - other.onset, pitch - other.pitch);
  }
  Vector operator-() const { return Vector(-onset, -pitch); }

  bool operator==(const Vector& other) const {
    return onset == other.onset && pitch == other.pitch;
  }
  bool operator!=(const Vector& other) const { return !(*this == other); }
  bool operator<(const Vector& other) const {
    if (onset != other.onset) return onset < other.onset;
    return pitch < other.pitch;
  }

  /// @brief Render as "(onset, pitch)".
  std::string toString() const;
};

/// @brief A note event in the point set: exact onset time and pitch height.
struct Point {
  Onset onset{0};
  double pitch = 0.0;

  Point() = default;
  Point(Onset onset_value, double pitch_value) : onset(onset_value), pitch(pitch_value) {}

  Point operator+(const Vector& translation) const {
    return Point(onset + translation.onset, pitch + translation.pitch);
  }

  /// @brief Vector leading from @p origin to this point.
  Vector operator-(const Point& origin) const {
    return Vector(onset - origin.onset, pitch - origin.pitch);
  }

  bool operator==(const Point& other) const {
    return onset == other.onset && pitch == other.pitch;
  }
  bool operator!=(const Point& other) const { return !(*this == other); }
  bool operator<(const Point& other) const {
    if (onset != other.onset) return onset < other.onset;
    return pitch < other.pitch;
  }

  /// @brief Render as "(onset, pitch)".
  std::string toString() const;
};

/// @brief Build a point from real coordinates (onset converted exactly).
/// @param onset Real onset; converted with onsetFromDouble().
/// @param pitch Pitch height.
Point makePoint(double onset, double pitch);

/// @brief Build a vector from real coordinates (onset converted exactly).
Vector makeVector(double onset, double pitch);

}  // namespace repat

#endif  // REPAT_CORE_POINT_H
