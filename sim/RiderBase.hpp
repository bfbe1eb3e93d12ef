#pragma once

#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include <raylib.h>

#include "sim/Environment.hpp"
#include "sim/FallDiagnostics.hpp"
#include "sim/RiderBody.hpp"
#include "sim/RiderTuning.hpp"
#include "sim/RiderTypes.hpp"

// Shared rider state machine: stability bookkeeping, fall dispatch, respawn
// immunity and environment sampling. Variants only implement locomotion.
//
// Driven by exactly one caller: TickInput once per rendered frame, TickPhysics
// once per fixed step. Once fallen, both are no-ops until ResetRider.
class RiderBase {
public:
  using FallListener = std::function<void(FallReason)>;
  using ListenerId = int;

  RiderBase() = default;
  virtual ~RiderBase() = default;

  RiderBase(const RiderBase &) = delete;
  RiderBase &operator=(const RiderBase &) = delete;

  virtual RiderType Type() const = 0;

  // --- Lifecycle ---

  // `tuning` is not owned and must outlive the rider. Null or unusable
  // tuning is logged and leaves the rider inert.
  void Initialize(const RiderTuning *tuning);

  void TickInput(const InputState &input, float frameDt);
  void TickPhysics(float deltaTime);

  // Teleports to a fresh, valid state and arms the respawn immunity window.
  void ResetRider(Vector3 position, Quaternion rotation);

  void SetEnvironment(const RiderEnvironment &env) { environment = env; }
  const RiderEnvironment &Environment() const { return environment; }

  // --- Discrete events ---

  // The only way a fall happens. Ignored while fallen or respawn-immune.
  void TriggerFall(FallReason reason);

  // Contact with an obstacle at `impactSpeed` (relative speed, units/s).
  void ApplyCollision(float impactSpeed);

  // Impulse-style stability change with the fairness cap applied.
  void ApplyStabilityImpulse(float delta, FallReason contributor);

  // --- Read-only state ---

  float Speed() const { return currentSpeed; }
  float Stability() const { return stability; }
  bool IsGrounded() const { return isGrounded; }
  bool HasFallen() const { return hasFallen; }
  float LeanAngle() const { return currentLean; }
  float Steer() const { return currentSteer; }
  bool IsRespawning() const { return isRespawning; }
  float RespawnImmunityRemaining() const { return respawnImmunityTimer; }
  bool IsInitialized() const { return tuning != nullptr; }
  RiderState State() const;

  const RiderBody &Body() const { return body; }
  const RiderTuning *Tuning() const { return tuning; }
  const EnvironmentSample &LastEnvironment() const { return env; }

  // Valid after the first fall since the last reset.
  const std::optional<FallSnapshot> &LastFallSnapshot() const {
    return lastFall;
  }
  std::optional<FallReason> LastFallContributor() const {
    return lastFallContributor;
  }

  // --- Fall notification ---

  ListenerId AddFallListener(FallListener listener);
  void RemoveFallListener(ListenerId id);

  void SetFallDebugLogging(const bool enabled) { fallDebugLogging = enabled; }

protected:
  virtual void ProcessInput(const InputState &input, float frameDt) = 0;
  virtual void ApplyMovement(float deltaTime) = 0;

  // Default lean follows steering directly.
  virtual void ApplyLean(float deltaTime);

  // Base rule: stability at or below the tuning threshold loses balance.
  virtual void CheckFallConditions(float deltaTime);

  virtual void OnRiderReset() {}

  // Continuous, clamped change. No per-tick cap: callers pass rates * dt.
  void ModifyStability(float delta);
  void SetStability(float value);

  // Shared by the variants: turn authority fades toward
  // highSpeedSteerFactor as speed approaches max.
  float GetSpeedAdjustedTurnRate() const;

  // Extra downward acceleration while airborne; the body integrator already
  // applies 1x gravity.
  void ApplyAirborneGravity(float deltaTime);

  const RiderTuning &Tune() const { return *tuning; }
  const InputState &LastInput() const { return lastInput; }
  const EnvironmentSample &Env() const { return env; }

  RiderBody body{};
  float currentSpeed = 0.0f;
  float currentSteer = 0.0f;
  float currentLean = 0.0f;

private:
  void UpdateGroundedState();
  void UpdateStability(float deltaTime);
  void ApplyWindForce(float deltaTime);
  void ResetRuntimeState();

  const RiderTuning *tuning = nullptr;
  RiderEnvironment environment{};
  EnvironmentSample env{};
  InputState lastInput{};

  float stability = 1.0f;
  bool isGrounded = false;
  bool hasFallen = false;
  bool isRespawning = false;
  float respawnImmunityTimer = 0.0f;

  std::optional<FallReason> lastFallContributor;
  std::optional<FallSnapshot> lastFall;
  bool fallDebugLogging = false;

  std::vector<std::pair<ListenerId, FallListener>> fallListeners;
  ListenerId nextListenerId = 1;
};
