#pragma once

#include <raylib.h>

// Kinematic stand-in for the rigid body a rider drives. Y is up, the rider
// faces +Z at yaw 0 and positive yaw turns right (clockwise seen from above).
struct RiderBody {
  Vector3 position{};
  Vector3 velocity{};
  float yawDeg = 0.0f;
  float leanDeg = 0.0f; // roll about the forward axis, mirrors the rider lean

  Vector3 Forward() const;
  Vector3 Right() const;
  Quaternion Rotation() const;
};

// Teleports the body and takes its heading from `rotation`. Roll and pitch
// are discarded; lean is owned by the rider.
void PlaceBody(RiderBody &body, Vector3 position, Quaternion rotation);

// Applies an acceleration for one step.
void AddAcceleration(RiderBody &body, Vector3 accel, float dt);

// Advances one fixed step: baseline gravity while airborne, no downward
// velocity while grounded, then position += velocity * dt.
void IntegrateBody(RiderBody &body, float dt, bool grounded);
