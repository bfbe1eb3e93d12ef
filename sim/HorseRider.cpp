#include "sim/HorseRider.hpp"

#include <algorithm>
#include <cmath>

#include <raymath.h>

#include "core/Config.hpp"
#include "sim/SimMath.hpp"

void HorseRider::ProcessInput(const InputState &input, const float frameDt) {
  const RiderTuning &t = Tune();

  const float inertiaFactor = 1.0f - t.momentumInertia;
  const float steerDelta = (input.steer - currentSteer) * inertiaFactor;
  currentSteer = simmath::Clamp(
      currentSteer + steerDelta * t.steerResponse * frameDt, -1.0f, 1.0f);

  momentumDirection = simmath::Lerp(momentumDirection, currentSteer,
                                    cfg::kHorseMomentumFollowRate * frameDt);

  // Speed eases toward the throttle target; brake and drag act on top.
  const float targetSpeed = input.throttle * t.maxSpeed;
  float speed = currentSpeed;
  speed += (targetSpeed - speed) * (t.acceleration / t.maxSpeed) * frameDt;
  speed -= input.brake * t.brakeDeceleration * frameDt;
  speed -= t.drag * frameDt;
  currentSpeed = simmath::Clamp(speed, 0.0f, t.maxSpeed);
}

void HorseRider::ApplyMovement(const float deltaTime) {
  if (!IsGrounded()) {
    ApplyAirborneGravity(deltaTime);
    return;
  }

  const RiderTuning &t = Tune();

  const float momentumFactor =
      1.0f - std::fabs(momentumDirection - currentSteer) * t.momentumInertia;
  const float turnRate = GetSpeedAdjustedTurnRate() *
                         std::max(cfg::kHorseMinTurnFactor, momentumFactor);

  body.yawDeg += currentSteer * turnRate * deltaTime;

  Vector3 velocity = Vector3Scale(body.Forward(), currentSpeed);
  velocity.y = body.velocity.y;
  body.velocity = velocity;
}

void HorseRider::ApplyLean(const float deltaTime) {
  const RiderTuning &t = Tune();

  const float speedFactor = simmath::Clamp01(currentSpeed / t.maxSpeed);
  const float targetLean = -momentumDirection * t.maxLeanAngle * speedFactor *
                           cfg::kHorseLeanAttenuation;

  currentLean = simmath::Lerp(currentLean, targetLean,
                              t.leanSpeed * cfg::kHorseLeanSpeedScale * deltaTime);
}

void HorseRider::CheckFallConditions(const float deltaTime) {
  RiderBase::CheckFallConditions(deltaTime);
  if (HasFallen()) {
    return;
  }

  const RiderTuning &t = Tune();
  wobble = std::fabs(currentSteer - momentumDirection);

  if (wobble < cfg::kHorseWobbleCorrectBelow && t.autoCorrection > 0.0f) {
    const float correction = t.autoCorrection *
                             (1.0f - wobble / cfg::kHorseWobbleCorrectBelow) *
                             deltaTime;
    ModifyStability(correction);
  }

  if (wobble > cfg::kHorseWobbleDrainAbove &&
      currentSpeed > t.maxSpeed * cfg::kHorseWobbleDrainSpeed) {
    ModifyStability(-cfg::kHorseWobbleDrainRate * deltaTime);
  }
}

void HorseRider::OnRiderReset() {
  momentumDirection = 0.0f;
  wobble = 0.0f;
}
