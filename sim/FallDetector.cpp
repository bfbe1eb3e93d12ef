#include "sim/FallDetector.hpp"

#include <utility>

#include "core/Config.hpp"
#include "core/Log.hpp"

FallDetector::~FallDetector() { StopMonitoring(); }

void FallDetector::StartMonitoring(RiderBase *target, const Track *newTrack) {
  StopMonitoring();

  rider = target;
  track = newTrack;
  killY = cfg::kFallKillY;
  outOfBoundsTimer = 0.0f;
  checkTimer = 0.0f;
  withinBounds = true;
  fallTriggered = false;

  if (rider != nullptr) {
    riderListener =
        rider->AddFallListener([this](FallReason reason) { Trigger(reason); });
  }
}

void FallDetector::StopMonitoring() {
  if (rider != nullptr) {
    rider->RemoveFallListener(riderListener);
  }
  rider = nullptr;
  riderListener = 0;
  fallTriggered = false;
}

void FallDetector::ResetFallState() {
  outOfBoundsTimer = 0.0f;
  withinBounds = true;
  fallTriggered = false;
}

void FallDetector::Update(const float deltaTime) {
  if (rider == nullptr) {
    return;
  }

  checkTimer -= deltaTime;
  if (checkTimer > 0.0f) {
    return;
  }
  checkTimer = cfg::kFallCheckInterval;

  CheckFallConditions();
}

void FallDetector::CheckFallConditions() {
  if (fallTriggered) {
    return;
  }

  const Vector3 position = rider->Body().position;

  if (position.y < killY) {
    Trigger(FallReason::FellOffEdge);
    return;
  }

  if (track == nullptr) {
    return;
  }

  if (ContainsPoint(*track, position)) {
    withinBounds = true;
    outOfBoundsTimer = 0.0f;
    return;
  }

  withinBounds = false;
  outOfBoundsTimer += cfg::kFallCheckInterval;
  if (outOfBoundsTimer >= cfg::kOutOfBoundsGrace) {
    Trigger(FallReason::FellOffEdge);
  }
}

void FallDetector::Trigger(const FallReason reason) {
  if (fallTriggered) {
    return;
  }

  // Edge falls detected here also put the rider itself into the fallen state.
  // The rider reports back through its fall listener, which re-enters here
  // with HasFallen() set. A rider that refuses the fall (respawn immunity)
  // leaves the detector armed so the next check retries.
  if (rider != nullptr && !rider->HasFallen()) {
    rider->TriggerFall(reason);
    if (!rider->HasFallen()) {
      LOG_DEBUG("FallDetector: {} deferred, rider is immune",
                FallReasonName(reason));
    }
    return;
  }

  fallTriggered = true;
  LOG_DEBUG("FallDetector: fall detected ({})", FallReasonName(reason));

  const auto snapshot = listeners;
  for (const auto &listener : snapshot) {
    listener(reason);
  }
}

void FallDetector::AddFallDetectedListener(FallDetectedListener listener) {
  listeners.push_back(std::move(listener));
}
