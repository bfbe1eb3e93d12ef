#include "sim/RiderTuning.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

#include "core/Log.hpp"

using json = nlohmann::json;

namespace {

RiderTuning BuildBikeTuning() {
  RiderTuning t{};
  t.riderName = "Bike";
  t.maxSpeed = 35.0f;
  t.acceleration = 18.0f;
  t.brakeDeceleration = 30.0f;
  t.drag = 2.5f;
  t.maxTurnRate = 100.0f;
  t.steerResponse = 10.0f;
  t.highSpeedSteerFactor = 0.4f;
  t.stabilityRecoveryRate = 0.6f;
  t.fallThreshold = 0.1f;
  t.steerStabilityCost = 0.25f;
  t.focusStabilityBonus = 0.15f;
  t.maxLeanAngle = 30.0f;
  t.leanSpeed = 8.0f;
  t.gravityMultiplier = 1.2f;
  t.groundCheckDistance = 0.4f;
  t.autoCorrection = 0.0f;
  t.momentumInertia = 0.0f;
  t.leanTurnInfluence = 0.6f;
  return t;
}

RiderTuning BuildHorseTuning() {
  RiderTuning t{};
  t.riderName = "Horse";
  t.maxSpeed = 28.0f;
  t.acceleration = 12.0f;
  t.brakeDeceleration = 20.0f;
  t.drag = 1.5f;
  t.maxTurnRate = 70.0f;
  t.steerResponse = 5.0f;
  t.highSpeedSteerFactor = 0.6f;
  t.stabilityRecoveryRate = 0.8f;
  t.fallThreshold = 0.08f;
  t.steerStabilityCost = 0.15f;
  t.focusStabilityBonus = 0.25f;
  t.maxLeanAngle = 18.0f;
  t.leanSpeed = 4.0f;
  t.gravityMultiplier = 1.0f;
  t.groundCheckDistance = 0.5f;
  t.autoCorrection = 0.4f;
  t.momentumInertia = 0.6f;
  t.leanTurnInfluence = 0.2f;
  return t;
}

void ReadFloat(const json &j, const char *key, float &out) {
  if (j.contains(key) && j[key].is_number()) {
    out = j[key].get<float>();
  }
}

bool ApplyJson(RiderTuning &tuning, const json &data, const char *source) {
  if (!data.is_object()) {
    LOG_ERROR("Rider tuning in {} is not a JSON object", source);
    return false;
  }

  RiderTuning t = tuning;
  t.riderName = data.value("riderName", t.riderName);

  ReadFloat(data, "maxSpeed", t.maxSpeed);
  ReadFloat(data, "acceleration", t.acceleration);
  ReadFloat(data, "brakeDeceleration", t.brakeDeceleration);
  ReadFloat(data, "drag", t.drag);

  ReadFloat(data, "maxTurnRate", t.maxTurnRate);
  ReadFloat(data, "steerResponse", t.steerResponse);
  ReadFloat(data, "highSpeedSteerFactor", t.highSpeedSteerFactor);

  ReadFloat(data, "stabilityRecoveryRate", t.stabilityRecoveryRate);
  ReadFloat(data, "fallThreshold", t.fallThreshold);
  ReadFloat(data, "steerStabilityCost", t.steerStabilityCost);
  ReadFloat(data, "focusStabilityBonus", t.focusStabilityBonus);

  ReadFloat(data, "maxLeanAngle", t.maxLeanAngle);
  ReadFloat(data, "leanSpeed", t.leanSpeed);

  ReadFloat(data, "gravityMultiplier", t.gravityMultiplier);
  ReadFloat(data, "groundCheckDistance", t.groundCheckDistance);

  ReadFloat(data, "autoCorrection", t.autoCorrection);
  ReadFloat(data, "momentumInertia", t.momentumInertia);
  ReadFloat(data, "leanTurnInfluence", t.leanTurnInfluence);

  if (!IsRiderTuningUsable(t)) {
    LOG_ERROR("Rider tuning in {} rejected", source);
    return false;
  }

  tuning = t;
  return true;
}

} // namespace

const RiderTuning &GetBikeTuning() {
  static const RiderTuning t = BuildBikeTuning();
  return t;
}

const RiderTuning &GetHorseTuning() {
  static const RiderTuning t = BuildHorseTuning();
  return t;
}

bool LoadRiderTuningFromFile(RiderTuning &tuning, const char *path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open rider tuning file: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);
    if (!ApplyJson(tuning, data, path)) {
      return false;
    }
    LOG_DEBUG("Loaded rider tuning '{}' from {}", tuning.riderName, path);
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("JSON error in {}: {}", path, e.what());
    return false;
  }
}

bool LoadRiderTuningFromString(RiderTuning &tuning, const std::string &text) {
  try {
    return ApplyJson(tuning, json::parse(text), "<string>");
  } catch (const json::exception &e) {
    LOG_ERROR("JSON error in rider tuning string: {}", e.what());
    return false;
  }
}

bool IsRiderTuningUsable(const RiderTuning &tuning) {
  if (!(tuning.maxSpeed > 0.0f)) {
    LOG_ERROR("Rider tuning '{}': maxSpeed must be positive (got {})",
              tuning.riderName, tuning.maxSpeed);
    return false;
  }
  if (!(tuning.maxLeanAngle > 0.0f)) {
    LOG_ERROR("Rider tuning '{}': maxLeanAngle must be positive (got {})",
              tuning.riderName, tuning.maxLeanAngle);
    return false;
  }
  if (tuning.groundCheckDistance < 0.0f) {
    LOG_ERROR("Rider tuning '{}': groundCheckDistance must not be negative",
              tuning.riderName);
    return false;
  }
  return true;
}
