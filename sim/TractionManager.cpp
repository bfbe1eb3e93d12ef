#include "sim/TractionManager.hpp"

#include <algorithm>
#include <cctype>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/SimMath.hpp"

namespace {

bool Contains(const BoundingBox &box, const Vector3 p) {
  return p.x >= box.min.x && p.x <= box.max.x && p.y >= box.min.y &&
         p.y <= box.max.y && p.z >= box.min.z && p.z <= box.max.z;
}

TractionZone MakeZone(const char *name, const float traction,
                      const float steering, const float stability) {
  TractionZone z{};
  z.surfaceType = name;
  z.tractionMultiplier = traction;
  z.steeringModifier = steering;
  z.stabilityModifier = stability;
  return z;
}

} // namespace

TractionZone MakeSurfaceZone(const SurfaceType type) {
  switch (type) {
  case SurfaceType::Road:
    return MakeZone("Road", 1.0f, 1.0f, 1.0f);
  case SurfaceType::WetStone:
    return MakeZone("WetStone", 0.7f, 0.9f, 0.9f);
  case SurfaceType::Gravel:
    return MakeZone("Gravel", 0.5f, 0.8f, 0.9f);
  case SurfaceType::Ice:
    return MakeZone("Ice", 0.3f, 0.5f, 0.7f);
  case SurfaceType::Mud:
    return MakeZone("Mud", 0.6f, 0.7f, 0.8f);
  case SurfaceType::BoostPad:
    return MakeZone("BoostPad", 1.2f, 1.0f, 1.0f);
  }
  return MakeZone("Road", 1.0f, 1.0f, 1.0f);
}

bool ParseSurfaceType(const char *text, SurfaceType &out) {
  if (text == nullptr) {
    return false;
  }
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (s == "road") {
    out = SurfaceType::Road;
  } else if (s == "wetstone" || s == "wet") {
    out = SurfaceType::WetStone;
  } else if (s == "gravel") {
    out = SurfaceType::Gravel;
  } else if (s == "ice") {
    out = SurfaceType::Ice;
  } else if (s == "mud") {
    out = SurfaceType::Mud;
  } else if (s == "boost" || s == "boostpad") {
    out = SurfaceType::BoostPad;
  } else {
    return false;
  }
  return true;
}

TractionManager::TractionManager() {
  transitionSpeed = cfg::kTractionTransitionSpeed;
  ClearAllZones();
}

const std::string &TractionManager::CurrentSurfaceType() const {
  static const std::string kDefault = "Default";
  if (activeZones.empty()) {
    return kDefault;
  }
  return zones[static_cast<size_t>(activeZones.back())].surfaceType;
}

int TractionManager::RegisterZone(const TractionZone &zone) {
  zones.push_back(zone);
  return static_cast<int>(zones.size()) - 1;
}

void TractionManager::EnterZone(const int zoneIndex) {
  if (zoneIndex < 0 || zoneIndex >= static_cast<int>(zones.size())) {
    LOG_WARN("TractionManager: enter of unknown zone {}", zoneIndex);
    return;
  }
  if (std::find(activeZones.begin(), activeZones.end(), zoneIndex) !=
      activeZones.end()) {
    return;
  }
  activeZones.push_back(zoneIndex);
  UpdateTargetValues();
}

void TractionManager::ExitZone(const int zoneIndex) {
  const auto it = std::find(activeZones.begin(), activeZones.end(), zoneIndex);
  if (it == activeZones.end()) {
    return;
  }
  activeZones.erase(it);
  UpdateTargetValues();
}

void TractionManager::TrackPosition(const Vector3 position) {
  for (int i = 0; i < static_cast<int>(zones.size()); ++i) {
    const bool inside = Contains(zones[static_cast<size_t>(i)].bounds, position);
    const bool active = std::find(activeZones.begin(), activeZones.end(), i) !=
                        activeZones.end();
    if (inside && !active) {
      EnterZone(i);
    } else if (!inside && active) {
      ExitZone(i);
    }
  }
}

void TractionManager::Update(const float deltaTime) {
  const float t = transitionSpeed * deltaTime;
  currentTraction = simmath::Lerp(currentTraction, targetTraction, t);
  currentSteering = simmath::Lerp(currentSteering, targetSteering, t);
  currentStability = simmath::Lerp(currentStability, targetStability, t);
}

void TractionManager::ClearAllZones() {
  activeZones.clear();
  UpdateTargetValues();

  currentTraction = defaultTraction;
  currentSteering = defaultSteering;
  currentStability = defaultStability;
}

void TractionManager::UpdateTargetValues() {
  if (activeZones.empty()) {
    targetTraction = defaultTraction;
    targetSteering = defaultSteering;
    targetStability = defaultStability;
    transitionSpeed = cfg::kTractionTransitionSpeed;
    return;
  }

  const TractionZone &top = zones[static_cast<size_t>(activeZones.back())];
  targetTraction = top.tractionMultiplier;
  targetSteering = top.steeringModifier;
  targetStability = top.stabilityModifier;
  transitionSpeed = top.transitionSpeed;
}
