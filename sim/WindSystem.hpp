#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <raylib.h>

#include "sim/Environment.hpp"

struct WindTuning {
  // Base wind
  bool enableAmbientWind = true;
  Vector3 baseWindDirection{1.0f, 0.0f, 0.0f}; // normalized on use
  float baseWindIntensity = 2.0f;
  float directionVariance = 15.0f; // degrees, 0 = constant
  float varianceSpeed = 0.3f;

  // Gusts
  bool enableGusts = true;
  float gustInterval = 8.0f;         // seconds
  float gustIntervalVariance = 3.0f; // +/- seconds
  float gustDuration = 1.5f;
  float gustIntensityMultiplier = 2.5f; // on top of base intensity

  // Rider effects
  float lateralForceMultiplier = 1.0f;
  float stabilityImpactPerIntensity = 0.02f;
  float effectSmoothSpeed = 4.0f;

  float strongWindThreshold = 5.0f;
};

// Loads wind tuning from a JSON file. Missing keys keep current values.
bool LoadWindTuningFromFile(WindTuning &tuning, const char *path);

// Ambient wind plus scheduled gusts and zone wind, smoothed into one vector.
// Without tuning the system reports zero wind.
class WindSystem final : public IWindProvider {
public:
  using GustListener = std::function<void(bool started)>;

  WindSystem() = default;

  // `tuning` is not owned. Null is allowed and logged.
  void Initialize(const WindTuning *tuning, uint32_t seed);

  void Update(float deltaTime);

  Vector3 GetLateralForce() const override;
  float GetStabilityImpact() const override;

  void AddZoneWind(Vector3 direction, float intensity);
  void ClearZoneWind();

  // Starts a gust now unless one is already running.
  void TriggerGust();

  // Overrides the tuning's base direction for this instance.
  void SetWindDirection(Vector3 direction);

  Vector3 CurrentWindDirection() const { return currentDirection; }
  Vector3 CurrentWindVector() const { return smoothedVector; }
  float CurrentIntensity() const { return smoothedIntensity; }
  bool IsGusting() const { return isGusting; }
  bool IsStrongWind() const;
  float Time() const { return time; }

  void AddGustListener(GustListener listener);

private:
  void UpdateAmbient();
  void UpdateGusts(float deltaTime);
  void CalculateFinalWind(float deltaTime);
  void StartGust();
  void ScheduleNextGust();
  void NotifyGust(bool started);

  const WindTuning *tuning = nullptr;
  uint32_t rng = 1u;
  float time = 0.0f;

  Vector3 baseDirection{1.0f, 0.0f, 0.0f};
  Vector3 currentDirection{1.0f, 0.0f, 0.0f};
  float currentIntensity = 0.0f;
  float ambientIntensity = 0.0f;
  float gustIntensity = 0.0f;
  float zoneIntensity = 0.0f;
  Vector3 zoneDirection{0.0f, 0.0f, 0.0f};

  float nextGustTime = 0.0f;
  float gustTimer = 0.0f;
  bool isGusting = false;

  Vector3 smoothedVector{0.0f, 0.0f, 0.0f};
  float smoothedIntensity = 0.0f;

  std::vector<GustListener> gustListeners;
};
