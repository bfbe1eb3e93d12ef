#include "sim/RiderBody.hpp"

#include <cmath>

#include <raymath.h>

#include "core/Config.hpp"
#include "sim/SimMath.hpp"

Vector3 RiderBody::Forward() const { return simmath::YawToForward(yawDeg); }

Vector3 RiderBody::Right() const { return simmath::YawToRight(yawDeg); }

Quaternion RiderBody::Rotation() const {
  return QuaternionFromEuler(0.0f, yawDeg * DEG2RAD, leanDeg * DEG2RAD);
}

void PlaceBody(RiderBody &body, const Vector3 position,
               const Quaternion rotation) {
  body.position = position;
  body.velocity = Vector3Zero();

  // Heading from where the rotation sends +Z, projected on the ground plane.
  const Vector3 fwd = Vector3RotateByQuaternion(Vector3{0.0f, 0.0f, 1.0f},
                                                QuaternionNormalize(rotation));
  if (fwd.x * fwd.x + fwd.z * fwd.z > 1e-6f) {
    body.yawDeg = std::atan2(fwd.x, fwd.z) * RAD2DEG;
  } else {
    body.yawDeg = 0.0f;
  }
  body.leanDeg = 0.0f;
}

void AddAcceleration(RiderBody &body, const Vector3 accel, const float dt) {
  body.velocity = Vector3Add(body.velocity, Vector3Scale(accel, dt));
}

void IntegrateBody(RiderBody &body, const float dt, const bool grounded) {
  if (grounded) {
    if (body.velocity.y < 0.0f) {
      body.velocity.y = 0.0f;
    }
  } else {
    body.velocity.y += cfg::kBaselineGravity * dt;
  }

  body.position = Vector3Add(body.position, Vector3Scale(body.velocity, dt));
}
