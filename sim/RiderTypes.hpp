#pragma once

#include <cstdint>

// Per-tick input pushed in by the host. Values outside their documented
// ranges are clamped by the rider when consumed.
struct InputState {
  float throttle = 0.0f; // 0..1
  float brake = 0.0f;    // 0..1
  float steer = 0.0f;    // -1 (left) .. 1 (right)
  bool focusHeld = false;
  bool resetPressed = false;

  static constexpr InputState Empty() { return InputState{}; }
};

// Why a rider fell. Exactly one is attached to every fall event.
enum class FallReason : int {
  LostBalance = 0,
  Collision = 1,
  FellOffEdge = 2,
  Overspeed = 3,
  ExternalForce = 4,
};

const char *FallReasonName(FallReason reason);

enum class RiderType : int {
  Bike = 0,
  Horse = 1,
};

const char *RiderTypeName(RiderType type);

// Accepts "bike"/"horse" (any case). Returns false for anything else.
bool ParseRiderType(const char *text, RiderType &out);

// Coarse lifecycle state derived from the rider's flags.
enum class RiderState : int {
  Inert = 0,         // no usable tuning; every tick is a no-op
  Active = 1,
  RespawnImmune = 2, // active, fall checks suspended
  Fallen = 3,
};

const char *RiderStateName(RiderState state);
