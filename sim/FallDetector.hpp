#pragma once

#include <functional>
#include <vector>

#include "sim/RiderBase.hpp"
#include "sim/RiderTypes.hpp"
#include "sim/Track.hpp"

// Watches a rider from the outside: kill height, track bounds with a grace
// period, and the rider's own fall event. Reports at most one fall until
// ResetFallState.
class FallDetector {
public:
  using FallDetectedListener = std::function<void(FallReason)>;

  FallDetector() = default;
  ~FallDetector();

  FallDetector(const FallDetector &) = delete;
  FallDetector &operator=(const FallDetector &) = delete;

  // Neither pointer is owned. A null track only checks the kill height.
  void StartMonitoring(RiderBase *rider, const Track *track);
  void StopMonitoring();
  void ResetFallState();

  // Runs the checks every kFallCheckInterval seconds of accumulated time.
  void Update(float deltaTime);

  void SetTrack(const Track *newTrack) { track = newTrack; }
  void SetKillY(float y) { killY = y; }

  bool IsMonitoring() const { return rider != nullptr; }
  bool IsWithinBounds() const { return withinBounds; }
  bool HasFallBeenTriggered() const { return fallTriggered; }

  void AddFallDetectedListener(FallDetectedListener listener);

private:
  void CheckFallConditions();
  void Trigger(FallReason reason);

  RiderBase *rider = nullptr;
  const Track *track = nullptr;
  RiderBase::ListenerId riderListener = 0;

  float killY = -50.0f;
  float outOfBoundsTimer = 0.0f;
  float checkTimer = 0.0f;
  bool withinBounds = true;
  bool fallTriggered = false;

  std::vector<FallDetectedListener> listeners;
};
