#pragma once

#include <string>

// All tunable parameters for one rider type. Loaded once when the rider is
// initialized and never written by the simulation.
struct RiderTuning {
  std::string riderName = "Rider";

  // Speed
  float maxSpeed = 30.0f;          // units/s
  float acceleration = 15.0f;      // units/s^2
  float brakeDeceleration = 25.0f; // units/s^2
  float drag = 2.0f;               // units/s^2, always applied

  // Steering
  float maxTurnRate = 90.0f;         // deg/s
  float steerResponse = 8.0f;        // higher = snappier
  float highSpeedSteerFactor = 0.5f; // turn authority left at max speed

  // Stability
  float stabilityRecoveryRate = 0.5f; // per second
  float fallThreshold = 0.1f;
  float steerStabilityCost = 0.3f;
  float focusStabilityBonus = 0.2f;

  // Lean
  float maxLeanAngle = 25.0f; // degrees
  float leanSpeed = 6.0f;

  // Physics
  float gravityMultiplier = 1.0f;
  float groundCheckDistance = 0.3f;

  // Type-specific
  float autoCorrection = 0.0f;    // horse: stability regained at low wobble
  float momentumInertia = 0.0f;   // horse: resistance to direction changes
  float leanTurnInfluence = 0.5f; // bike: extra turn rate from lean
};

// Reference presets.
const RiderTuning &GetBikeTuning();
const RiderTuning &GetHorseTuning();

// Loads tuning from a JSON object file. Missing keys keep the values already
// in `tuning`, so callers usually start from a preset. Returns false (and
// logs) when the file is missing or malformed; `tuning` is left untouched.
bool LoadRiderTuningFromFile(RiderTuning &tuning, const char *path);

// Parses tuning from a JSON string. Same semantics as the file loader.
bool LoadRiderTuningFromString(RiderTuning &tuning, const std::string &text);

// A tuning the integrators can divide by: positive max speed and lean angle.
// Logs the first offending field.
bool IsRiderTuningUsable(const RiderTuning &tuning);
