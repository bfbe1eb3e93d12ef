#include "sim/RiderBase.hpp"

#include <algorithm>
#include <cmath>

#include <raymath.h>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/SimMath.hpp"

namespace {

// NaN fails every comparison in Clamp, so non-finite axes read as released.
float FiniteOrZero(const float value) {
  return std::isfinite(value) ? value : 0.0f;
}

InputState ClampInput(const InputState &in) {
  InputState out = in;
  out.throttle = simmath::Clamp01(FiniteOrZero(in.throttle));
  out.brake = simmath::Clamp01(FiniteOrZero(in.brake));
  out.steer = simmath::Clamp(FiniteOrZero(in.steer), -1.0f, 1.0f);
  return out;
}

} // namespace

void RiderBase::Initialize(const RiderTuning *tuningAsset) {
  tuning = nullptr;
  ResetRuntimeState();
  isRespawning = false;
  respawnImmunityTimer = 0.0f;

  if (tuningAsset == nullptr) {
    LOG_ERROR("[{}] RiderTuning is null. Rider will stay inert.",
              RiderTypeName(Type()));
    return;
  }
  if (!IsRiderTuningUsable(*tuningAsset)) {
    LOG_ERROR("[{}] RiderTuning '{}' is unusable. Rider will stay inert.",
              RiderTypeName(Type()), tuningAsset->riderName);
    return;
  }

  tuning = tuningAsset;
  LOG_DEBUG("[{}] Initialized with tuning '{}'", RiderTypeName(Type()),
            tuning->riderName);
}

void RiderBase::TickInput(const InputState &input, const float frameDt) {
  if (hasFallen || tuning == nullptr) {
    return;
  }

  lastInput = ClampInput(input);
  ProcessInput(lastInput, frameDt);
}

void RiderBase::TickPhysics(const float deltaTime) {
  if (hasFallen || tuning == nullptr) {
    return;
  }

  if (isRespawning) {
    respawnImmunityTimer -= deltaTime;
    if (respawnImmunityTimer <= 0.0f) {
      respawnImmunityTimer = 0.0f;
      isRespawning = false;
    }
  }

  // Order matters: environment -> ground -> stability -> fall check -> move.
  env = SampleEnvironment(environment);
  UpdateGroundedState();
  UpdateStability(deltaTime);

  if (!isRespawning) {
    CheckFallConditions(deltaTime);
  }

  if (hasFallen) {
    return;
  }

  ApplyMovement(deltaTime);
  ApplyLean(deltaTime);
  ApplyWindForce(deltaTime);

  body.leanDeg = currentLean;
  IntegrateBody(body, deltaTime, isGrounded);
}

void RiderBase::ResetRider(const Vector3 position, const Quaternion rotation) {
  PlaceBody(body, position, rotation);
  ResetRuntimeState();

  isRespawning = true;
  respawnImmunityTimer = cfg::kRespawnImmunityDuration;

  OnRiderReset();
}

void RiderBase::ResetRuntimeState() {
  body.velocity = Vector3Zero();
  body.leanDeg = 0.0f;

  currentSpeed = 0.0f;
  currentSteer = 0.0f;
  currentLean = 0.0f;
  stability = cfg::kStabilityMax;
  hasFallen = false;
  lastInput = InputState::Empty();

  env = EnvironmentSample{};

  lastFallContributor.reset();
  lastFall.reset();
}

RiderState RiderBase::State() const {
  if (tuning == nullptr) {
    return RiderState::Inert;
  }
  if (hasFallen) {
    return RiderState::Fallen;
  }
  if (isRespawning) {
    return RiderState::RespawnImmune;
  }
  return RiderState::Active;
}

// --- Stability ---

void RiderBase::UpdateStability(const float deltaTime) {
  const RiderTuning &t = *tuning;

  float recovery = t.stabilityRecoveryRate * env.stabilityModifier * deltaTime;
  if (lastInput.focusHeld) {
    recovery += t.focusStabilityBonus * deltaTime;
  }

  const float windDrain = env.windStabilityDrain * deltaTime;
  if (windDrain > cfg::kWindContributorRate * deltaTime) {
    lastFallContributor = FallReason::ExternalForce;
  }

  // Steering costs more on slippery surfaces.
  const float tractionPenalty =
      1.0f + (1.0f - env.tractionFactor) * cfg::kSteerTractionPenalty;
  const float steerCost = std::fabs(currentSteer) * t.steerStabilityCost *
                          tractionPenalty * deltaTime;

  const float speedRatio = currentSpeed / t.maxSpeed;
  const float speedPenalty =
      speedRatio * std::fabs(currentSteer) * cfg::kSpeedSteerPenalty * deltaTime;

  ModifyStability(recovery - steerCost - speedPenalty - windDrain);
}

void RiderBase::ModifyStability(const float delta) {
  stability =
      simmath::Clamp(stability + delta, cfg::kStabilityMin, cfg::kStabilityMax);
}

void RiderBase::SetStability(const float value) {
  stability = simmath::Clamp(value, cfg::kStabilityMin, cfg::kStabilityMax);
}

void RiderBase::ApplyStabilityImpulse(const float delta,
                                      const FallReason contributor) {
  if (delta >= 0.0f) {
    ModifyStability(delta);
    return;
  }

  if (delta < -cfg::kSignificantImpulse) {
    lastFallContributor = contributor;
  }

  if (stability > cfg::kImpulseCapThreshold) {
    // Above the threshold one impulse can take at most the cap, so a safe
    // rider always survives a single hit.
    const float cappedDrop = std::max(delta, -cfg::kMaxStabilityDropPerImpulse);
    const float floor = stability - cfg::kMaxStabilityDropPerImpulse;
    SetStability(std::max(stability + cappedDrop, floor));
  } else {
    ModifyStability(delta);
  }
}

// --- Falls ---

void RiderBase::CheckFallConditions(float /*deltaTime*/) {
  if (stability <= tuning->fallThreshold) {
    TriggerFall(FallReason::LostBalance);
  }
}

void RiderBase::TriggerFall(const FallReason reason) {
  if (hasFallen || isRespawning) {
    return;
  }

  FallSnapshot snap{};
  snap.reason = reason;
  snap.stability = stability;
  snap.speed = currentSpeed;
  snap.grounded = isGrounded;
  snap.windForce = Vector3Length(env.windForce);
  snap.windStabilityDrain = env.windStabilityDrain;
  snap.traction = env.tractionFactor;
  snap.steer = currentSteer;
  snap.lean = currentLean;
  lastFall = snap;

  hasFallen = true;

  if (fallDebugLogging && tuning != nullptr) {
    LogFallDiagnostics(RiderTypeName(Type()), snap, *tuning,
                       lastFallContributor);
  }

  // Listeners may unsubscribe while we dispatch, so iterate a snapshot.
  // The rider must outlive the dispatch; RiderManager defers despawns for it.
  const auto listeners = fallListeners;
  for (const auto &entry : listeners) {
    entry.second(reason);
  }
}

void RiderBase::ApplyCollision(const float impactSpeed) {
  if (hasFallen || isRespawning || tuning == nullptr) {
    return;
  }

  if (impactSpeed > cfg::kCollisionFallImpact) {
    lastFallContributor = FallReason::Collision;
    TriggerFall(FallReason::Collision);
  } else if (impactSpeed > cfg::kCollisionShakeImpact) {
    ApplyStabilityImpulse(cfg::kCollisionStabilityHit, FallReason::Collision);
  }
}

RiderBase::ListenerId RiderBase::AddFallListener(FallListener listener) {
  const ListenerId id = nextListenerId++;
  fallListeners.emplace_back(id, std::move(listener));
  return id;
}

void RiderBase::RemoveFallListener(const ListenerId id) {
  fallListeners.erase(
      std::remove_if(fallListeners.begin(), fallListeners.end(),
                     [id](const auto &entry) { return entry.first == id; }),
      fallListeners.end());
}

// --- Ground, wind, lean ---

void RiderBase::UpdateGroundedState() {
  if (environment.ground == nullptr) {
    isGrounded = false;
    return;
  }
  isGrounded = environment.ground->HasGroundBelow(body.position,
                                                  tuning->groundCheckDistance);
}

void RiderBase::ApplyWindForce(const float deltaTime) {
  if (Vector3LengthSqr(env.windForce) < cfg::kMinWindForceSqr) {
    return;
  }
  if (!isGrounded) {
    return;
  }
  AddAcceleration(body, env.windForce, deltaTime);
}

void RiderBase::ApplyLean(const float deltaTime) {
  const float targetLean = -currentSteer * tuning->maxLeanAngle;
  currentLean =
      simmath::Lerp(currentLean, targetLean, tuning->leanSpeed * deltaTime);
}

void RiderBase::ApplyAirborneGravity(const float deltaTime) {
  const Vector3 extra{0.0f,
                      cfg::kBaselineGravity * (tuning->gravityMultiplier - 1.0f),
                      0.0f};
  AddAcceleration(body, extra, deltaTime);
}

float RiderBase::GetSpeedAdjustedTurnRate() const {
  const float speedRatio = currentSpeed / tuning->maxSpeed;
  const float steerFactor =
      simmath::Lerp(1.0f, tuning->highSpeedSteerFactor, speedRatio);
  return tuning->maxTurnRate * steerFactor;
}
