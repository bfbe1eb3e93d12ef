#pragma once

#include <cmath>

#include <raylib.h>
#include <raymath.h>

// Scalar helpers shared by the rider integrators. Lerp clamps its factor to
// [0, 1] so that large time steps settle on the target instead of
// overshooting it.
namespace simmath {

inline float Clamp(const float value, const float minValue,
                   const float maxValue) {
  if (value < minValue) {
    return minValue;
  }
  if (value > maxValue) {
    return maxValue;
  }
  return value;
}

inline float Clamp01(const float value) { return Clamp(value, 0.0f, 1.0f); }

inline float Lerp(const float a, const float b, const float t) {
  return a + (b - a) * Clamp01(t);
}

inline Vector3 LerpV(const Vector3 a, const Vector3 b, const float t) {
  return Vector3Lerp(a, b, Clamp01(t));
}

inline float ClampMinZero(const float value) {
  return (value < 0.0f) ? 0.0f : value;
}

// Direction after a clockwise (seen from +Y) yaw of `yawDeg` applied to +Z.
inline Vector3 YawToForward(const float yawDeg) {
  const float rad = yawDeg * DEG2RAD;
  return Vector3{std::sin(rad), 0.0f, std::cos(rad)};
}

inline Vector3 YawToRight(const float yawDeg) {
  const float rad = yawDeg * DEG2RAD;
  return Vector3{std::cos(rad), 0.0f, -std::sin(rad)};
}

inline Vector3 Horizontal(const Vector3 v) { return Vector3{v.x, 0.0f, v.z}; }

} // namespace simmath
