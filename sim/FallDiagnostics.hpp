#pragma once

#include <optional>
#include <string>

#include "sim/RiderTypes.hpp"

struct RiderTuning;

// Rider state captured at the instant a fall was dispatched.
struct FallSnapshot {
  FallReason reason = FallReason::LostBalance;
  float stability = 0.0f;
  float speed = 0.0f;
  bool grounded = false;
  float windForce = 0.0f; // magnitude
  float windStabilityDrain = 0.0f;
  float traction = 1.0f;
  float steer = 0.0f;
  float lean = 0.0f;
};

// Best-effort, human readable root cause. Purely diagnostic: it may be wrong
// when several contributors overlap and nothing in the simulation reads it.
std::string DeterminePrimaryCause(const FallSnapshot &snapshot,
                                  const RiderTuning &tuning,
                                  std::optional<FallReason> lastContributor);

void LogFallDiagnostics(const char *riderName, const FallSnapshot &snapshot,
                        const RiderTuning &tuning,
                        std::optional<FallReason> lastContributor);
