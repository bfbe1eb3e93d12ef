#pragma once

namespace cfg {

// --- Timing ---
constexpr float kFixedDt = 1.0f / 50.0f;

// --- Stability ---
constexpr float kStabilityMin = 0.0f;
constexpr float kStabilityMax = 1.0f;

// Fairness: a single impulse can never take more than this from a rider that
// is above the safety threshold.
constexpr float kMaxStabilityDropPerImpulse = 0.4f;
constexpr float kImpulseCapThreshold = 0.5f;
// Impulses larger than this are remembered as the last fall contributor.
constexpr float kSignificantImpulse = 0.1f;

constexpr float kWindContributorRate = 0.05f; // drain/s marking wind as cause
constexpr float kSteerTractionPenalty = 0.5f;
constexpr float kSpeedSteerPenalty = 0.1f;

// --- Respawn ---
constexpr float kRespawnImmunityDuration = 0.5f;

// --- Collisions ---
constexpr float kCollisionFallImpact = 10.0f;   // relative speed, instant fall
constexpr float kCollisionShakeImpact = 5.0f;   // relative speed, impulse only
constexpr float kCollisionStabilityHit = -0.3f;

// --- Physics ---
constexpr float kBaselineGravity = -9.81f;
constexpr float kMinWindForceSqr = 0.01f;

// --- Bike ---
constexpr float kBikeTractionTurnBlend = 0.7f;
constexpr float kBikeSlipBlend = 0.3f;
constexpr float kBikeLeanSpeedRef = 0.5f; // fraction of max speed for full lean
constexpr float kBikeWindLeanFactor = 0.5f;
constexpr float kBikeMaxLeanOvershoot = 1.2f;

// --- Horse ---
constexpr float kHorseMomentumFollowRate = 2.0f;
constexpr float kHorseMinTurnFactor = 0.3f;
constexpr float kHorseLeanAttenuation = 0.7f;
constexpr float kHorseLeanSpeedScale = 0.5f;
constexpr float kHorseWobbleCorrectBelow = 0.3f;
constexpr float kHorseWobbleDrainAbove = 0.8f;
constexpr float kHorseWobbleDrainSpeed = 0.7f; // fraction of max speed
constexpr float kHorseWobbleDrainRate = 0.1f;

// --- Fall diagnostics ---
constexpr float kDiagWindDrain = 0.1f;
constexpr float kDiagOverLean = 0.9f;
constexpr float kDiagLowTraction = 0.5f;
constexpr float kDiagHighSpeed = 0.8f;
constexpr float kDiagHardSteer = 0.5f;

// --- Traction ---
constexpr float kTractionTransitionSpeed = 8.0f;

// --- Fall detector ---
constexpr float kFallKillY = -50.0f;
constexpr float kOutOfBoundsGrace = 0.5f;
constexpr float kFallCheckInterval = 0.1f;
constexpr float kTrackBoundsBelow = 5.0f;
constexpr float kTrackBoundsAbove = 30.0f;

// --- Track ---
constexpr float kRiderHalfWidth = 0.4f;
constexpr float kDefaultSpawnZ = 2.0f;

} // namespace cfg
