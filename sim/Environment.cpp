#include "sim/Environment.hpp"

EnvironmentSample SampleEnvironment(const RiderEnvironment &env) {
  EnvironmentSample sample{};

  if (env.traction) {
    sample.tractionFactor = env.traction->CurrentTraction();
    sample.steeringModifier = env.traction->CurrentSteeringModifier();
    sample.stabilityModifier = env.traction->CurrentStabilityModifier();
  }

  if (env.wind) {
    sample.windForce = env.wind->GetLateralForce();
    sample.windStabilityDrain = env.wind->GetStabilityImpact();
  }

  return sample;
}
