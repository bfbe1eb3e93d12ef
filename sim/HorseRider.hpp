#pragma once

#include "sim/RiderBase.hpp"

// Momentum-based horse. Steering passes through an inertia filter, a lagging
// momentum direction drives the lean, and disagreement between the two
// ("wobble") costs turn rate and, at speed, stability. Small wobble is
// auto-corrected.
class HorseRider final : public RiderBase {
public:
  RiderType Type() const override { return RiderType::Horse; }

  float MomentumDirection() const { return momentumDirection; }
  float Wobble() const { return wobble; }

protected:
  void ProcessInput(const InputState &input, float frameDt) override;
  void ApplyMovement(float deltaTime) override;
  void ApplyLean(float deltaTime) override;
  void CheckFallConditions(float deltaTime) override;
  void OnRiderReset() override;

private:
  float momentumDirection = 0.0f;
  float wobble = 0.0f;
};
