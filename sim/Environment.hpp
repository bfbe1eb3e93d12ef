#pragma once

#include <raylib.h>

// Capabilities the rider consumes from its host. All of them are read-only
// from the rider's point of view and all are optional: a missing provider
// yields the neutral sample (traction 1, no wind, never grounded).

class IGroundProbe {
public:
  virtual ~IGroundProbe() = default;

  // True if there is ground within `distance` straight down from `origin`.
  virtual bool HasGroundBelow(Vector3 origin, float distance) const = 0;
};

class ITractionProvider {
public:
  virtual ~ITractionProvider() = default;

  virtual float CurrentTraction() const = 0;
  virtual float CurrentSteeringModifier() const = 0;
  virtual float CurrentStabilityModifier() const = 0;
};

class IWindProvider {
public:
  virtual ~IWindProvider() = default;

  // Lateral acceleration applied to a grounded rider.
  virtual Vector3 GetLateralForce() const = 0;
  // Stability drained per second.
  virtual float GetStabilityImpact() const = 0;
};

// Non-owning references injected into a rider. The host keeps the providers
// alive for as long as the rider may tick.
struct RiderEnvironment {
  const IGroundProbe *ground = nullptr;
  const ITractionProvider *traction = nullptr;
  const IWindProvider *wind = nullptr;
};

// Modifier values for one physics tick. Re-sampled every tick.
struct EnvironmentSample {
  float tractionFactor = 1.0f;
  float steeringModifier = 1.0f;
  float stabilityModifier = 1.0f;
  Vector3 windForce{0.0f, 0.0f, 0.0f};
  float windStabilityDrain = 0.0f;
};

EnvironmentSample SampleEnvironment(const RiderEnvironment &env);
