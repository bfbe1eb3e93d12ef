#pragma once

#include "sim/RiderBase.hpp"

// Arcade precision bike: snappy steering, no momentum inertia, lean tied to
// speed and pushed by crosswind. Lean adds turn authority.
class BikeRider final : public RiderBase {
public:
  RiderType Type() const override { return RiderType::Bike; }

protected:
  void ProcessInput(const InputState &input, float frameDt) override;
  void ApplyMovement(float deltaTime) override;
  void ApplyLean(float deltaTime) override;
};
