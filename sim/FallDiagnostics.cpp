#include "sim/FallDiagnostics.hpp"

#include <cmath>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/RiderTuning.hpp"

std::string DeterminePrimaryCause(const FallSnapshot &snapshot,
                                  const RiderTuning &tuning,
                                  const std::optional<FallReason> lastContributor) {
  if (lastContributor && *lastContributor != snapshot.reason) {
    return std::string(FallReasonName(snapshot.reason)) + " (triggered by " +
           FallReasonName(*lastContributor) + ")";
  }

  if (snapshot.reason != FallReason::LostBalance) {
    return FallReasonName(snapshot.reason);
  }

  if (snapshot.windStabilityDrain > cfg::kDiagWindDrain) {
    return "Wind Gust";
  }
  if (std::fabs(snapshot.lean) > tuning.maxLeanAngle * cfg::kDiagOverLean) {
    return "Over-Lean";
  }
  if (snapshot.traction < cfg::kDiagLowTraction) {
    return "Low Traction";
  }
  if (snapshot.speed > tuning.maxSpeed * cfg::kDiagHighSpeed &&
      std::fabs(snapshot.steer) > cfg::kDiagHardSteer) {
    return "High-Speed Steering";
  }
  return "Accumulated Instability";
}

void LogFallDiagnostics(const char *riderName, const FallSnapshot &snapshot,
                        const RiderTuning &tuning,
                        const std::optional<FallReason> lastContributor) {
  const float speedPct = snapshot.speed / tuning.maxSpeed * 100.0f;
  LOG_INFO("[FallDiagnostics] {} FELL", riderName);
  LOG_INFO("  reason:        {}", FallReasonName(snapshot.reason));
  LOG_INFO("  primary cause: {}",
           DeterminePrimaryCause(snapshot, tuning, lastContributor));
  LOG_INFO("  speed:         {:.1f} ({:.0f}% of max)", snapshot.speed, speedPct);
  LOG_INFO("  stability:     {:.3f} (threshold {:.3f})", snapshot.stability,
           tuning.fallThreshold);
  LOG_INFO("  grounded:      {}", snapshot.grounded);
  LOG_INFO("  wind force:    {:.2f}", snapshot.windForce);
  LOG_INFO("  traction:      {:.2f}", snapshot.traction);
  LOG_INFO("  steer:         {:.2f}", snapshot.steer);
  LOG_INFO("  lean:          {:.1f} deg", snapshot.lean);
}
