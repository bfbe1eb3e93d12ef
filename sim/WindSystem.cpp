#include "sim/WindSystem.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>

#include <raymath.h>

#include "core/Log.hpp"
#include "core/Rng.hpp"
#include "sim/SimMath.hpp"

using json = nlohmann::json;

namespace {

void ReadFloat(const json &j, const char *key, float &out) {
  if (j.contains(key) && j[key].is_number()) {
    out = j[key].get<float>();
  }
}

void ReadBool(const json &j, const char *key, bool &out) {
  if (j.contains(key) && j[key].is_boolean()) {
    out = j[key].get<bool>();
  }
}

void ReadVector(const json &j, const char *key, Vector3 &out) {
  if (!j.contains(key) || !j[key].is_array() || j[key].size() != 3) {
    return;
  }
  const auto &a = j[key];
  out = Vector3{a[0].get<float>(), a[1].get<float>(), a[2].get<float>()};
}

Vector3 NormalizedOrZero(const Vector3 v) {
  if (Vector3LengthSqr(v) < 1e-8f) {
    return Vector3Zero();
  }
  return Vector3Normalize(v);
}

} // namespace

bool LoadWindTuningFromFile(WindTuning &tuning, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open wind tuning file: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);
    if (!data.is_object()) {
      LOG_ERROR("Wind tuning in {} is not a JSON object", path);
      return false;
    }

    WindTuning t = tuning;
    ReadBool(data, "enableAmbientWind", t.enableAmbientWind);
    ReadVector(data, "baseWindDirection", t.baseWindDirection);
    ReadFloat(data, "baseWindIntensity", t.baseWindIntensity);
    ReadFloat(data, "directionVariance", t.directionVariance);
    ReadFloat(data, "varianceSpeed", t.varianceSpeed);
    ReadBool(data, "enableGusts", t.enableGusts);
    ReadFloat(data, "gustInterval", t.gustInterval);
    ReadFloat(data, "gustIntervalVariance", t.gustIntervalVariance);
    ReadFloat(data, "gustDuration", t.gustDuration);
    ReadFloat(data, "gustIntensityMultiplier", t.gustIntensityMultiplier);
    ReadFloat(data, "lateralForceMultiplier", t.lateralForceMultiplier);
    ReadFloat(data, "stabilityImpactPerIntensity",
              t.stabilityImpactPerIntensity);
    ReadFloat(data, "effectSmoothSpeed", t.effectSmoothSpeed);
    ReadFloat(data, "strongWindThreshold", t.strongWindThreshold);

    if (!(t.gustDuration > 0.0f)) {
      LOG_ERROR("Wind tuning in {}: gustDuration must be positive", path);
      return false;
    }

    tuning = t;
    LOG_DEBUG("Loaded wind tuning from {}", path);
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("JSON error in {}: {}", path, e.what());
    return false;
  }
}

void WindSystem::Initialize(const WindTuning *windTuning, const uint32_t seed) {
  tuning = windTuning;
  rng = (seed == 0u) ? 1u : seed;
  time = 0.0f;

  ambientIntensity = 0.0f;
  gustIntensity = 0.0f;
  currentIntensity = 0.0f;
  isGusting = false;
  gustTimer = 0.0f;
  smoothedVector = Vector3Zero();
  smoothedIntensity = 0.0f;
  ClearZoneWind();

  if (tuning == nullptr) {
    LOG_WARN("WindSystem: no WindTuning assigned, wind stays calm");
    return;
  }

  baseDirection = NormalizedOrZero(tuning->baseWindDirection);
  currentDirection = baseDirection;
  ScheduleNextGust();
}

void WindSystem::Update(const float deltaTime) {
  if (tuning == nullptr) {
    return;
  }

  time += deltaTime;
  UpdateAmbient();
  UpdateGusts(deltaTime);
  CalculateFinalWind(deltaTime);
}

void WindSystem::UpdateAmbient() {
  if (!tuning->enableAmbientWind) {
    ambientIntensity = 0.0f;
    return;
  }

  Vector3 dir = baseDirection;
  if (tuning->directionVariance > 0.0f) {
    const float varianceDeg =
        std::sin(time * tuning->varianceSpeed) * tuning->directionVariance;
    const Quaternion q = QuaternionFromAxisAngle(Vector3{0.0f, 1.0f, 0.0f},
                                                 varianceDeg * DEG2RAD);
    dir = Vector3RotateByQuaternion(dir, q);
  }

  currentDirection = dir;
  ambientIntensity = tuning->baseWindIntensity;
}

void WindSystem::UpdateGusts(const float deltaTime) {
  if (!tuning->enableGusts) {
    gustIntensity = 0.0f;
    return;
  }

  if (!isGusting) {
    if (time >= nextGustTime) {
      StartGust();
    }
    return;
  }

  gustTimer += deltaTime;
  const float progress = gustTimer / tuning->gustDuration;
  if (progress >= 1.0f) {
    isGusting = false;
    gustIntensity = 0.0f;
    NotifyGust(false);
    ScheduleNextGust();
    return;
  }

  // Ramps up, peaks mid-gust, ramps down.
  const float curve = std::sin(progress * PI);
  gustIntensity =
      tuning->baseWindIntensity * tuning->gustIntensityMultiplier * curve;
}

void WindSystem::CalculateFinalWind(const float deltaTime) {
  currentIntensity = ambientIntensity + gustIntensity + zoneIntensity;

  Vector3 targetDirection = currentDirection;
  if (zoneIntensity > 0.0f && Vector3LengthSqr(zoneDirection) > 0.01f) {
    const float zoneWeight = zoneIntensity / std::max(currentIntensity, 0.01f);
    targetDirection = NormalizedOrZero(
        simmath::LerpV(currentDirection, zoneDirection, zoneWeight));
  }

  const float t = tuning->effectSmoothSpeed * deltaTime;
  smoothedIntensity = simmath::Lerp(smoothedIntensity, currentIntensity, t);
  smoothedVector = simmath::LerpV(
      smoothedVector, Vector3Scale(targetDirection, smoothedIntensity), t);
}

void WindSystem::StartGust() {
  isGusting = true;
  gustTimer = 0.0f;
  NotifyGust(true);
}

void WindSystem::ScheduleNextGust() {
  const float variance = core::NextRange(rng, -tuning->gustIntervalVariance,
                                         tuning->gustIntervalVariance);
  nextGustTime = time + tuning->gustInterval + variance;
}

void WindSystem::NotifyGust(const bool started) {
  const auto listeners = gustListeners;
  for (const auto &listener : listeners) {
    listener(started);
  }
}

void WindSystem::AddZoneWind(const Vector3 direction, const float intensity) {
  zoneDirection = NormalizedOrZero(direction);
  zoneIntensity = std::max(0.0f, intensity);
}

void WindSystem::ClearZoneWind() {
  zoneDirection = Vector3Zero();
  zoneIntensity = 0.0f;
}

void WindSystem::TriggerGust() {
  if (tuning == nullptr || isGusting) {
    return;
  }
  StartGust();
}

void WindSystem::SetWindDirection(const Vector3 direction) {
  baseDirection = NormalizedOrZero(direction);
  currentDirection = baseDirection;
}

Vector3 WindSystem::GetLateralForce() const {
  if (tuning == nullptr) {
    return Vector3Zero();
  }
  return Vector3Scale(smoothedVector, tuning->lateralForceMultiplier);
}

float WindSystem::GetStabilityImpact() const {
  if (tuning == nullptr) {
    return 0.0f;
  }
  return smoothedIntensity * tuning->stabilityImpactPerIntensity;
}

bool WindSystem::IsStrongWind() const {
  return tuning != nullptr && smoothedIntensity >= tuning->strongWindThreshold;
}

void WindSystem::AddGustListener(GustListener listener) {
  gustListeners.push_back(std::move(listener));
}
