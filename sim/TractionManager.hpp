#pragma once

#include <string>
#include <vector>

#include <raylib.h>

#include "sim/Environment.hpp"

// A surface patch that changes grip. Bounds are an axis-aligned box; zones
// registered with the manager are entered and left by position.
struct TractionZone {
  std::string surfaceType = "Gravel";
  float tractionMultiplier = 0.5f; // 1 = normal, <1 slippery, >1 extra grip
  float steeringModifier = 0.8f;
  float stabilityModifier = 0.9f;
  float transitionSpeed = 8.0f;
  BoundingBox bounds{};
};

enum class SurfaceType : int {
  Road = 0,
  WetStone = 1,
  Gravel = 2,
  Ice = 3,
  Mud = 4,
  BoostPad = 5,
};

// Zone preset for a surface type with empty bounds.
TractionZone MakeSurfaceZone(SurfaceType type);

// Accepts the preset names above (case-insensitive).
bool ParseSurfaceType(const char *text, SurfaceType &out);

// Combines the zones a rider is in into smoothed modifiers. The most recently
// entered zone wins; with no zone the defaults apply.
class TractionManager final : public ITractionProvider {
public:
  TractionManager();

  float CurrentTraction() const override { return currentTraction; }
  float CurrentSteeringModifier() const override { return currentSteering; }
  float CurrentStabilityModifier() const override { return currentStability; }

  const std::string &CurrentSurfaceType() const;
  bool InTractionZone() const { return !activeZones.empty(); }

  // Zones are referenced by index into the registered list.
  int RegisterZone(const TractionZone &zone);
  const std::vector<TractionZone> &Zones() const { return zones; }

  void EnterZone(int zoneIndex);
  void ExitZone(int zoneIndex);

  // Enters/exits registered zones according to `position`.
  void TrackPosition(Vector3 position);

  // Eases the current modifiers toward the active targets.
  void Update(float deltaTime);

  // Leaves every zone and snaps straight back to the defaults.
  void ClearAllZones();

private:
  void UpdateTargetValues();

  float defaultTraction = 1.0f;
  float defaultSteering = 1.0f;
  float defaultStability = 1.0f;

  std::vector<TractionZone> zones;
  std::vector<int> activeZones; // entry order, last is on top

  float currentTraction = 1.0f;
  float currentSteering = 1.0f;
  float currentStability = 1.0f;
  float targetTraction = 1.0f;
  float targetSteering = 1.0f;
  float targetStability = 1.0f;
  float transitionSpeed = 8.0f;
};
