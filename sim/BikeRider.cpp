#include "sim/BikeRider.hpp"

#include <cmath>

#include <raymath.h>

#include "core/Config.hpp"
#include "sim/SimMath.hpp"

void BikeRider::ProcessInput(const InputState &input, const float frameDt) {
  const RiderTuning &t = Tune();
  const EnvironmentSample &e = Env();

  const float steerResponse = t.steerResponse * e.steeringModifier;
  currentSteer = simmath::Lerp(currentSteer, input.steer, steerResponse * frameDt);

  // Traction limits how much drive and braking reach the ground; drag does
  // not care.
  const float accel = input.throttle * t.acceleration * e.tractionFactor;
  const float braking = input.brake * t.brakeDeceleration * e.tractionFactor;
  const float netAccel = accel - braking - t.drag;

  currentSpeed =
      simmath::Clamp(currentSpeed + netAccel * frameDt, 0.0f, t.maxSpeed);
}

void BikeRider::ApplyMovement(const float deltaTime) {
  if (!IsGrounded()) {
    ApplyAirborneGravity(deltaTime);
    return;
  }

  const RiderTuning &t = Tune();
  const float traction = Env().tractionFactor;

  const float leanInfluence =
      std::fabs(currentLean) / t.maxLeanAngle * t.leanTurnInfluence;
  float turnRate = GetSpeedAdjustedTurnRate() * (1.0f + leanInfluence);
  // Low traction dulls turning but never removes it.
  turnRate *= simmath::Lerp(1.0f, traction, cfg::kBikeTractionTurnBlend);

  body.yawDeg += currentSteer * turnRate * deltaTime;

  Vector3 velocity = Vector3Scale(body.Forward(), currentSpeed);
  const Vector3 previous = body.velocity;

  if (traction < 1.0f) {
    // Slip: part of the old horizontal momentum survives the heading change.
    const float slip = 1.0f - traction;
    const Vector3 carried = Vector3Scale(
        Vector3Normalize(simmath::Horizontal(previous)), currentSpeed);
    velocity = simmath::LerpV(velocity, carried, slip * cfg::kBikeSlipBlend);
  }

  velocity.y = previous.y;
  body.velocity = velocity;
}

void BikeRider::ApplyLean(const float deltaTime) {
  const RiderTuning &t = Tune();

  const float speedFactor =
      simmath::Clamp01(currentSpeed / (t.maxSpeed * cfg::kBikeLeanSpeedRef));
  float targetLean = -currentSteer * t.maxLeanAngle * speedFactor;

  const Vector3 wind = Env().windForce;
  if (Vector3LengthSqr(wind) > cfg::kMinWindForceSqr) {
    targetLean += Vector3DotProduct(wind, body.Right()) * cfg::kBikeWindLeanFactor;
  }

  currentLean = simmath::Lerp(currentLean, targetLean, t.leanSpeed * deltaTime);

  const float limit = t.maxLeanAngle * cfg::kBikeMaxLeanOvershoot;
  currentLean = simmath::Clamp(currentLean, -limit, limit);
}
