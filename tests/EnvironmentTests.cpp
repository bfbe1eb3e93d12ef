#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <raymath.h>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/BikeRider.hpp"
#include "sim/Bot.hpp"
#include "sim/FallDetector.hpp"
#include "sim/HorseRider.hpp"
#include "sim/RiderManager.hpp"
#include "sim/Track.hpp"
#include "sim/TractionManager.hpp"
#include "sim/WindSystem.hpp"

namespace {
bool NearlyEqual(const float a, const float b, const float eps = 1e-5f) {
  return std::fabs(a - b) <= eps;
}

struct FlatGround final : IGroundProbe {
  bool HasGroundBelow(Vector3 /*origin*/, float /*distance*/) const override {
    return true;
  }
};

// No push, only a constant stability drain.
struct DrainingWind final : IWindProvider {
  explicit DrainingWind(const float perSecond) : drain(perSecond) {}
  Vector3 GetLateralForce() const override { return Vector3Zero(); }
  float GetStabilityImpact() const override { return drain; }
  float drain;
};

// Calm wind with no gusts and no direction drift.
WindTuning SteadyWind(const float intensity) {
  WindTuning t{};
  t.baseWindIntensity = intensity;
  t.directionVariance = 0.0f;
  t.enableGusts = false;
  return t;
}

// --- Traction ---

bool TestTractionDefaults() {
  TractionManager traction;
  return traction.CurrentTraction() == 1.0f &&
         traction.CurrentSteeringModifier() == 1.0f &&
         traction.CurrentStabilityModifier() == 1.0f &&
         !traction.InTractionZone() &&
         traction.CurrentSurfaceType() == "Default";
}

bool TestTractionEasesTowardZone() {
  TractionManager traction;
  const int ice = traction.RegisterZone(MakeSurfaceZone(SurfaceType::Ice));
  traction.EnterZone(ice);

  traction.Update(cfg::kFixedDt);
  const float t = cfg::kTractionTransitionSpeed * cfg::kFixedDt;
  if (!NearlyEqual(traction.CurrentTraction(), 1.0f + (0.3f - 1.0f) * t)) {
    return false;
  }

  for (int i = 0; i < 200; ++i) {
    traction.Update(cfg::kFixedDt);
  }
  return NearlyEqual(traction.CurrentTraction(), 0.3f, 1e-4f) &&
         NearlyEqual(traction.CurrentSteeringModifier(), 0.5f, 1e-4f) &&
         traction.CurrentSurfaceType() == "Ice";
}

bool TestTractionLatestZoneWins() {
  TractionManager traction;
  const int gravel = traction.RegisterZone(MakeSurfaceZone(SurfaceType::Gravel));
  const int ice = traction.RegisterZone(MakeSurfaceZone(SurfaceType::Ice));

  traction.EnterZone(gravel);
  traction.EnterZone(ice);
  traction.EnterZone(gravel); // already inside: no reorder
  if (traction.CurrentSurfaceType() != "Ice") {
    return false;
  }

  traction.ExitZone(ice);
  for (int i = 0; i < 200; ++i) {
    traction.Update(cfg::kFixedDt);
  }
  return traction.CurrentSurfaceType() == "Gravel" &&
         NearlyEqual(traction.CurrentTraction(), 0.5f, 1e-4f);
}

bool TestTractionClearSnapsToDefaults() {
  TractionManager traction;
  traction.EnterZone(traction.RegisterZone(MakeSurfaceZone(SurfaceType::Mud)));
  for (int i = 0; i < 50; ++i) {
    traction.Update(cfg::kFixedDt);
  }
  traction.ClearAllZones();
  traction.EnterZone(42); // unknown: ignored
  return traction.CurrentTraction() == 1.0f &&
         traction.CurrentStabilityModifier() == 1.0f &&
         !traction.InTractionZone();
}

bool TestTractionTracksPosition() {
  TractionManager traction;
  TractionZone wet = MakeSurfaceZone(SurfaceType::WetStone);
  wet.bounds.min = Vector3{-2.0f, -1.0f, 10.0f};
  wet.bounds.max = Vector3{2.0f, 2.0f, 20.0f};
  traction.RegisterZone(wet);

  traction.TrackPosition(Vector3{0.0f, 0.0f, 5.0f});
  const bool before = traction.InTractionZone();
  traction.TrackPosition(Vector3{0.0f, 0.0f, 15.0f});
  const bool inside = traction.CurrentSurfaceType() == "WetStone";
  traction.TrackPosition(Vector3{0.0f, 0.0f, 25.0f});
  return !before && inside && !traction.InTractionZone();
}

bool TestSurfacePresetsAndNames() {
  SurfaceType s = SurfaceType::Road;
  return MakeSurfaceZone(SurfaceType::Road).tractionMultiplier == 1.0f &&
         MakeSurfaceZone(SurfaceType::WetStone).tractionMultiplier == 0.7f &&
         MakeSurfaceZone(SurfaceType::Gravel).tractionMultiplier == 0.5f &&
         MakeSurfaceZone(SurfaceType::Ice).tractionMultiplier == 0.3f &&
         MakeSurfaceZone(SurfaceType::Mud).tractionMultiplier == 0.6f &&
         MakeSurfaceZone(SurfaceType::BoostPad).tractionMultiplier == 1.2f &&
         ParseSurfaceType("ICE", s) && s == SurfaceType::Ice &&
         !ParseSurfaceType("lava", s);
}

// --- Wind ---

bool TestWindWithoutTuningIsCalm() {
  WindSystem wind;
  wind.Initialize(nullptr, 7u);
  wind.Update(1.0f);
  wind.TriggerGust();
  return Vector3Length(wind.GetLateralForce()) == 0.0f &&
         wind.GetStabilityImpact() == 0.0f && !wind.IsGusting() &&
         !wind.IsStrongWind();
}

bool TestSteadyWindSettles() {
  const WindTuning tuning = SteadyWind(3.0f);
  WindSystem wind;
  wind.Initialize(&tuning, 1u);
  for (int i = 0; i < 500; ++i) {
    wind.Update(cfg::kFixedDt);
  }
  const Vector3 f = wind.GetLateralForce();
  return NearlyEqual(f.x, 3.0f, 1e-3f) && NearlyEqual(f.z, 0.0f, 1e-4f) &&
         NearlyEqual(wind.GetStabilityImpact(), 3.0f * 0.02f, 1e-4f) &&
         !wind.IsStrongWind();
}

bool TestWindRampsUp() {
  const WindTuning tuning = SteadyWind(3.0f);
  WindSystem wind;
  wind.Initialize(&tuning, 1u);
  wind.Update(cfg::kFixedDt);
  const float first = wind.CurrentIntensity();
  wind.Update(cfg::kFixedDt);
  return first > 0.0f && first < 3.0f && wind.CurrentIntensity() > first;
}

bool TestGustCycle() {
  WindTuning tuning = SteadyWind(2.0f);
  tuning.enableGusts = true;
  tuning.gustInterval = 2.0f;
  tuning.gustIntervalVariance = 0.0f;
  tuning.gustDuration = 1.0f;

  WindSystem wind;
  wind.Initialize(&tuning, 99u);
  int starts = 0;
  int ends = 0;
  wind.AddGustListener([&](bool started) { started ? ++starts : ++ends; });

  float peak = 0.0f;
  for (int i = 0; i < 90; ++i) { // 1.8 s
    wind.Update(cfg::kFixedDt);
  }
  if (wind.IsGusting() || starts != 0) {
    return false;
  }
  for (int i = 0; i < 40; ++i) { // into the gust
    wind.Update(cfg::kFixedDt);
    peak = std::fmax(peak, wind.CurrentIntensity());
  }
  if (!wind.IsGusting() || starts != 1) {
    return false;
  }
  wind.TriggerGust(); // already gusting: ignored
  for (int i = 0; i < 60; ++i) {
    wind.Update(cfg::kFixedDt);
  }
  return starts == 1 && ends == 1 && !wind.IsGusting() && peak > 2.5f;
}

bool TestGustScheduleIsDeterministic() {
  WindTuning tuning{};
  tuning.gustInterval = 3.0f;
  tuning.gustIntervalVariance = 2.0f;

  WindSystem a;
  WindSystem b;
  a.Initialize(&tuning, 1234u);
  b.Initialize(&tuning, 1234u);
  int gustsA = 0;
  a.AddGustListener([&](bool started) { gustsA += started ? 1 : 0; });

  for (int i = 0; i < 3000; ++i) {
    a.Update(cfg::kFixedDt);
    b.Update(cfg::kFixedDt);
    const Vector3 fa = a.GetLateralForce();
    const Vector3 fb = b.GetLateralForce();
    if (fa.x != fb.x || fa.y != fb.y || fa.z != fb.z) {
      return false;
    }
  }
  // 60 s at roughly one gust per 1..5 s plus duration.
  return gustsA >= 8;
}

bool TestDirectionVarianceStaysHorizontal() {
  WindTuning tuning = SteadyWind(2.0f);
  tuning.directionVariance = 30.0f;
  tuning.varianceSpeed = 1.0f;

  WindSystem wind;
  wind.Initialize(&tuning, 5u);
  float maxZ = 0.0f;
  for (int i = 0; i < 200; ++i) {
    wind.Update(cfg::kFixedDt);
    const Vector3 d = wind.CurrentWindDirection();
    if (!NearlyEqual(d.y, 0.0f) || !NearlyEqual(Vector3Length(d), 1.0f, 1e-4f)) {
      return false;
    }
    maxZ = std::fmax(maxZ, std::fabs(d.z));
  }
  // sin(30 deg) is the most the heading can swing off +X.
  return maxZ > 0.1f && maxZ <= 0.5f + 1e-4f;
}

bool TestZoneWindTakesOver() {
  WindTuning tuning = SteadyWind(0.0f);
  tuning.enableAmbientWind = false;

  WindSystem wind;
  wind.Initialize(&tuning, 3u);
  wind.AddZoneWind(Vector3{0.0f, 0.0f, 2.0f}, 6.0f);
  for (int i = 0; i < 500; ++i) {
    wind.Update(cfg::kFixedDt);
  }
  const Vector3 f = wind.GetLateralForce();
  const bool strong = wind.IsStrongWind();

  wind.ClearZoneWind();
  for (int i = 0; i < 500; ++i) {
    wind.Update(cfg::kFixedDt);
  }
  return NearlyEqual(f.z, 6.0f, 1e-3f) && NearlyEqual(f.x, 0.0f, 1e-3f) &&
         strong && wind.CurrentIntensity() < 1e-3f;
}

bool TestSetWindDirection() {
  const WindTuning tuning = SteadyWind(1.0f);
  WindSystem wind;
  wind.Initialize(&tuning, 3u);
  wind.SetWindDirection(Vector3{0.0f, 0.0f, -5.0f});
  for (int i = 0; i < 500; ++i) {
    wind.Update(cfg::kFixedDt);
  }
  return NearlyEqual(wind.GetLateralForce().z, -1.0f, 1e-3f);
}

bool TestWindTuningFile() {
  WindTuning t{};
  t.baseWindIntensity = 9.0f;
  const bool ok = LoadWindTuningFromFile(t, assets::Path("tuning/wind.json"));
  WindTuning untouched{};
  const bool missing = LoadWindTuningFromFile(untouched, "no/such/wind.json");
  return ok && t.baseWindIntensity == 2.0f && t.gustDuration == 1.5f &&
         !missing && untouched.baseWindIntensity == 2.0f;
}

// --- Track ---

bool TestFindSegmentUnder() {
  const Track track = MakeStraightTrack(3, 10.0f, 4.0f);
  return FindSegmentUnder(track, 5.0f, 0.0f, 0.4f) == 0 &&
         FindSegmentUnder(track, 25.0f, 2.3f, 0.4f) == 2 &&
         FindSegmentUnder(track, 25.0f, 2.5f, 0.4f) == -1 &&
         FindSegmentUnder(track, 31.0f, 0.0f, 0.4f) == -1 &&
         NearlyEqual(track.totalLength, 30.0f);
}

bool TestGroundProbe() {
  Track track = MakeStraightTrack(2, 10.0f, 4.0f);
  track.segments[1].startZ = 15.0f; // gap 10..15
  const TrackGroundProbe probe(&track);
  return probe.HasGroundBelow(Vector3{0.0f, 0.0f, 5.0f}, 0.3f) &&
         probe.HasGroundBelow(Vector3{0.0f, 0.2f, 5.0f}, 0.3f) &&
         !probe.HasGroundBelow(Vector3{0.0f, 1.0f, 5.0f}, 0.3f) &&
         !probe.HasGroundBelow(Vector3{0.0f, 0.0f, 12.0f}, 0.3f) &&
         !probe.HasGroundBelow(Vector3{5.0f, 0.0f, 5.0f}, 0.3f);
}

bool TestTrackContainsPoint() {
  const Track track = MakeStraightTrack(2, 10.0f, 4.0f);
  return ContainsPoint(track, Vector3{0.0f, 0.0f, 5.0f}) &&
         ContainsPoint(track, Vector3{1.9f, -4.0f, 15.0f}) &&
         !ContainsPoint(track, Vector3{0.0f, -6.0f, 5.0f}) &&
         !ContainsPoint(track, Vector3{3.0f, 0.0f, 5.0f}) &&
         !ContainsPoint(track, Vector3{0.0f, 0.0f, 25.0f});
}

bool TestLoadShippedTrack() {
  Track track{};
  if (!LoadTrackFromFile(track, assets::Path("tracks/ridge1.json"))) {
    return false;
  }
  TractionManager traction;
  RegisterTrackSurfaces(track, traction);
  traction.TrackPosition(Vector3{1.0f, 0.0f, 120.0f});

  const Vector3 spawn = GetSpawnPosition(track);
  return track.segments.size() == 8 && track.surfaces.size() == 3 &&
         NearlyEqual(track.totalLength, 400.0f) && NearlyEqual(spawn.z, 2.0f) &&
         traction.Zones().size() == 3 &&
         traction.CurrentSurfaceType() == "Gravel";
}

bool TestMissingTrackFails() {
  Track track = MakeStraightTrack(2, 10.0f, 4.0f);
  return !LoadTrackFromFile(track, "no/such/track.json") &&
         track.segments.empty() &&
         NearlyEqual(GetSpawnZ(track), cfg::kDefaultSpawnZ);
}

// --- Fall detector ---

bool TestKillHeightEndsRun() {
  BikeRider bike;
  bike.Initialize(&GetBikeTuning());

  FallDetector detector;
  detector.StartMonitoring(&bike, nullptr);
  int events = 0;
  FallReason got = FallReason::LostBalance;
  detector.AddFallDetectedListener([&](FallReason reason) {
    ++events;
    got = reason;
  });

  for (int i = 0; i < 500 && !bike.HasFallen(); ++i) {
    bike.TickPhysics(cfg::kFixedDt);
    detector.Update(cfg::kFixedDt);
  }
  return events == 1 && got == FallReason::FellOffEdge && bike.HasFallen() &&
         bike.Body().position.y < cfg::kFallKillY + 1.0f;
}

bool TestOutOfBoundsGrace() {
  const Track track = MakeStraightTrack(5, 10.0f, 4.0f);
  FlatGround ground;

  BikeRider bike;
  bike.Initialize(&GetBikeTuning());
  bike.SetEnvironment(RiderEnvironment{&ground, nullptr, nullptr});
  bike.ResetRider(Vector3{10.0f, 0.0f, 5.0f}, QuaternionIdentity());
  for (int i = 0; i < 30; ++i) { // outlive the respawn window
    bike.TickPhysics(cfg::kFixedDt);
  }

  FallDetector detector;
  detector.StartMonitoring(&bike, &track);

  for (int i = 0; i < 15; ++i) { // 0.3 s
    bike.TickPhysics(cfg::kFixedDt);
    detector.Update(cfg::kFixedDt);
  }
  if (bike.HasFallen() || detector.IsWithinBounds()) {
    return false;
  }
  for (int i = 0; i < 35; ++i) {
    bike.TickPhysics(cfg::kFixedDt);
    detector.Update(cfg::kFixedDt);
  }
  return bike.HasFallen() && detector.HasFallBeenTriggered() &&
         bike.LastFallSnapshot()->reason == FallReason::FellOffEdge;
}

bool TestInBoundsRiderNeverFlagged() {
  const Track track = MakeStraightTrack(5, 10.0f, 4.0f);
  const TrackGroundProbe ground(&track);

  BikeRider bike;
  bike.Initialize(&GetBikeTuning());
  bike.SetEnvironment(RiderEnvironment{&ground, nullptr, nullptr});
  bike.ResetRider(Vector3{0.0f, 0.0f, 5.0f}, QuaternionIdentity());

  FallDetector detector;
  detector.StartMonitoring(&bike, &track);
  for (int i = 0; i < 200; ++i) {
    bike.TickPhysics(cfg::kFixedDt);
    detector.Update(cfg::kFixedDt);
  }
  return !bike.HasFallen() && detector.IsWithinBounds() &&
         !detector.HasFallBeenTriggered();
}

bool TestDetectorForwardsRiderFall() {
  HorseRider horse;
  horse.Initialize(&GetHorseTuning());

  FallDetector detector;
  detector.StartMonitoring(&horse, nullptr);
  std::vector<FallReason> seen;
  detector.AddFallDetectedListener(
      [&](FallReason reason) { seen.push_back(reason); });

  horse.ApplyCollision(20.0f);
  if (seen.size() != 1 || seen[0] != FallReason::Collision) {
    return false;
  }

  horse.ResetRider(Vector3Zero(), QuaternionIdentity());
  detector.ResetFallState();
  for (int i = 0; i < 30; ++i) {
    horse.TickPhysics(cfg::kFixedDt);
  }
  horse.TriggerFall(FallReason::Overspeed);

  detector.StopMonitoring();
  horse.ResetRider(Vector3Zero(), QuaternionIdentity());
  for (int i = 0; i < 30; ++i) {
    horse.TickPhysics(cfg::kFixedDt);
  }
  horse.TriggerFall(FallReason::LostBalance);

  return seen.size() == 2 && seen[1] == FallReason::Overspeed &&
         !detector.IsMonitoring();
}

bool TestDetectorUnsubscribesOnDestruction() {
  BikeRider bike;
  bike.Initialize(&GetBikeTuning());
  int events = 0;
  {
    FallDetector detector;
    detector.StartMonitoring(&bike, nullptr);
    detector.AddFallDetectedListener([&](FallReason) { ++events; });
  }
  bike.TriggerFall(FallReason::LostBalance);
  return events == 0 && bike.HasFallen();
}

bool TestDetectorRetriesAfterImmunity() {
  const Track track = MakeStraightTrack(4, 25.0f, 4.0f);

  BikeRider bike;
  bike.Initialize(&GetBikeTuning());
  bike.ResetRider(Vector3{0.0f, -60.0f, 5.0f}, QuaternionIdentity());

  FallDetector detector;
  detector.StartMonitoring(&bike, &track);
  int detected = 0;
  detector.AddFallDetectedListener([&](FallReason) { ++detected; });

  bool quietWhileImmune = true;
  for (int i = 0; i < 200 && !bike.HasFallen(); ++i) {
    bike.TickPhysics(cfg::kFixedDt);
    detector.Update(cfg::kFixedDt);
    if (bike.IsRespawning() &&
        (detected > 0 || detector.HasFallBeenTriggered())) {
      quietWhileImmune = false;
    }
  }
  return quietWhileImmune && bike.HasFallen() && detected == 1 &&
         detector.HasFallBeenTriggered() &&
         bike.LastFallSnapshot()->reason == FallReason::FellOffEdge;
}

// --- Rider manager ---

bool TestSpawnPlacesRiderAtSpawnPoint() {
  RiderManager manager;
  int spawned = 0;
  manager.AddSpawnedListener([&](RiderBase &) { ++spawned; });
  manager.SetSpawnPoint(Vector3{1.0f, 2.0f, 3.0f}, QuaternionIdentity());
  manager.SpawnRider(RiderType::Horse);

  const RiderBase *rider = manager.ActiveRider();
  return rider != nullptr && rider->Type() == RiderType::Horse &&
         rider->IsInitialized() && rider->IsRespawning() &&
         NearlyEqual(rider->Body().position.z, 3.0f) && spawned == 1 &&
         manager.CurrentRiderType() == RiderType::Horse;
}

bool TestSwapRider() {
  RiderManager manager;
  std::vector<std::string> log;
  manager.AddSpawnedListener([&](RiderBase &r) {
    log.push_back(std::string("+") + RiderTypeName(r.Type()));
  });
  manager.AddDespawnedListener([&](RiderBase &r) {
    log.push_back(std::string("-") + RiderTypeName(r.Type()));
  });

  manager.SpawnRider(RiderType::Bike);
  manager.SwapRider(RiderType::Bike);
  manager.SwapRider(RiderType::Horse);

  return log.size() == 3 && log[0] == "+Bike" && log[1] == "-Bike" &&
         log[2] == "+Horse" && manager.ActiveRider()->Type() == RiderType::Horse;
}

bool TestSpawnIgnoredDuringSwap() {
  RiderManager manager;
  manager.AddSpawnedListener(
      [&](RiderBase &) { manager.SpawnRider(RiderType::Horse); });
  manager.SpawnRider(RiderType::Bike);
  return !manager.IsSwapping() && manager.ActiveRider() != nullptr &&
         manager.ActiveRider()->Type() == RiderType::Bike;
}

bool TestSpawnWithoutTuningFails() {
  RiderManager manager;
  manager.SetTuning(RiderType::Bike, nullptr);
  manager.SpawnRider(RiderType::Bike);
  manager.Update(InputState::Empty(), cfg::kFixedDt);
  manager.FixedUpdate(cfg::kFixedDt);
  return manager.ActiveRider() == nullptr && !manager.IsSwapping();
}

bool TestResetInputRespawnsFallenRider() {
  TractionManager traction;
  RiderManager manager;
  manager.SetTractionManager(&traction);
  manager.SetEnvironment(RiderEnvironment{nullptr, &traction, nullptr});
  manager.SpawnRider(RiderType::Bike);

  std::vector<FallReason> fell;
  manager.AddFellListener([&](FallReason r) { fell.push_back(r); });

  for (int i = 0; i < 30; ++i) {
    manager.FixedUpdate(cfg::kFixedDt);
  }
  traction.EnterZone(traction.RegisterZone(MakeSurfaceZone(SurfaceType::Ice)));
  manager.ActiveRider()->ApplyCollision(15.0f);

  InputState reset{};
  reset.resetPressed = true;
  manager.Update(reset, cfg::kFixedDt);

  const RiderBase *rider = manager.ActiveRider();
  return fell.size() == 1 && fell[0] == FallReason::Collision &&
         !rider->HasFallen() && rider->IsRespawning() &&
         manager.RespawnCount() == 1 && !traction.InTractionZone();
}

bool TestResetInputIgnoredWhileRiding() {
  RiderManager manager;
  manager.SpawnRider(RiderType::Bike);
  InputState in{};
  in.resetPressed = true;
  in.throttle = 1.0f;
  manager.Update(in, cfg::kFixedDt);
  return manager.RespawnCount() == 0 && manager.ActiveRider()->Speed() > 0.0f;
}

bool TestDespawnClearsRider() {
  RiderManager manager;
  int despawned = 0;
  manager.AddDespawnedListener([&](RiderBase &) { ++despawned; });
  manager.SpawnRider(RiderType::Bike);
  manager.DespawnCurrentRider();
  manager.DespawnCurrentRider();
  manager.RespawnCurrentRider();
  return manager.ActiveRider() == nullptr && despawned == 1;
}

bool TestSwapFromFellListenerWaitsForTick() {
  FlatGround ground;
  const DrainingWind wind(20.0f);

  RiderManager manager;
  manager.SetEnvironment(RiderEnvironment{&ground, nullptr, &wind});
  manager.SpawnRider(RiderType::Bike);

  int fell = 0;
  int spawned = 0;
  bool bikeKeptDuringDispatch = false;
  manager.AddSpawnedListener([&](RiderBase &) { ++spawned; });
  manager.AddFellListener([&](FallReason) {
    ++fell;
    manager.SwapRider(RiderType::Horse);
    const RiderBase *rider = manager.ActiveRider();
    bikeKeptDuringDispatch = rider != nullptr &&
                             rider->Type() == RiderType::Bike &&
                             manager.HasPendingRequest();
  });

  // The bike falls right after its immunity; the horse is still immune at
  // the end of the loop.
  for (int i = 0; i < 40; ++i) {
    manager.FixedUpdate(cfg::kFixedDt);
  }

  const RiderBase *rider = manager.ActiveRider();
  return fell == 1 && bikeKeptDuringDispatch && spawned == 1 &&
         !manager.HasPendingRequest() && rider != nullptr &&
         rider->Type() == RiderType::Horse && !rider->HasFallen();
}

bool TestDespawnFromDetectorFallWaitsForManager() {
  RiderManager manager;
  manager.SpawnRider(RiderType::Bike);
  manager.AddFellListener([&](FallReason) { manager.DespawnCurrentRider(); });

  FallDetector detector;
  detector.StartMonitoring(manager.ActiveRider(), nullptr);
  int detected = 0;
  detector.AddFallDetectedListener([&](FallReason) { ++detected; });

  // No ground: the rider drops through the kill height.
  for (int i = 0; i < 500 && detected == 0; ++i) {
    manager.FixedUpdate(cfg::kFixedDt);
    detector.Update(cfg::kFixedDt);
  }
  const bool keptUntilNextTick = manager.HasPendingRequest() &&
                                 manager.ActiveRider() != nullptr &&
                                 manager.ActiveRider()->HasFallen();

  detector.StopMonitoring();
  manager.FixedUpdate(cfg::kFixedDt);
  return detected == 1 && keptUntilNextTick &&
         manager.ActiveRider() == nullptr && !manager.HasPendingRequest();
}

// --- Bot ---

bool TestBotIsDeterministic() {
  const Track track = MakeStraightTrack(10, 20.0f, 4.0f);
  BikeRider bike;
  bike.Initialize(&GetBikeTuning());

  Bot a{};
  Bot b{};
  InitBot(a, BotStyle::Random, 77u);
  InitBot(b, BotStyle::Random, 77u);
  for (int i = 0; i < 100; ++i) {
    const InputState ia = BotInput(a, bike, &track);
    const InputState ib = BotInput(b, bike, &track);
    if (ia.steer != ib.steer || ia.throttle != ib.throttle ||
        ia.brake != ib.brake || ia.focusHeld != ib.focusHeld) {
      return false;
    }
    if (ia.steer < -1.0f || ia.steer > 1.0f) {
      return false;
    }
  }
  BotStyle parsed = BotStyle::Cautious;
  return ParseBotStyle("aggressive", parsed) &&
         parsed == BotStyle::Aggressive && !ParseBotStyle("reckless", parsed);
}

bool TestCautiousBotRidesStraightRidge() {
  const Track track = MakeStraightTrack(20, 25.0f, 4.0f);
  const TrackGroundProbe ground(&track);
  TractionManager traction;

  RiderManager manager;
  manager.SetEnvironment(RiderEnvironment{&ground, &traction, nullptr});
  manager.SetTractionManager(&traction);
  manager.SetSpawnPoint(GetSpawnPosition(track), QuaternionIdentity());
  manager.SpawnRider(RiderType::Bike);

  FallDetector detector;
  detector.StartMonitoring(manager.ActiveRider(), &track);

  Bot bot{};
  InitBot(bot, BotStyle::Cautious, 1u);
  for (int i = 0; i < 500; ++i) { // 10 s
    const InputState in = BotInput(bot, *manager.ActiveRider(), &track);
    manager.Update(in, cfg::kFixedDt);
    traction.Update(cfg::kFixedDt);
    manager.FixedUpdate(cfg::kFixedDt);
    detector.Update(cfg::kFixedDt);
  }

  const RiderBase *rider = manager.ActiveRider();
  return !rider->HasFallen() && !detector.HasFallBeenTriggered() &&
         rider->Body().position.z > 150.0f && rider->IsGrounded();
}

bool TestBotRequestsResetWhenFallen() {
  BikeRider bike;
  bike.Initialize(&GetBikeTuning());
  bike.TriggerFall(FallReason::LostBalance);
  Bot bot{};
  InitBot(bot, BotStyle::Aggressive, 0u);
  const InputState in = BotInput(bot, bike, nullptr);
  return in.resetPressed && in.throttle == 0.0f && bot.rng == 1u;
}

} // namespace

int main() {
  Log::InitConsoleOnly();
  Log::SetLevel(spdlog::level::warn);
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("traction_defaults", TestTractionDefaults());
  run("traction_eases_toward_zone", TestTractionEasesTowardZone());
  run("traction_latest_zone_wins", TestTractionLatestZoneWins());
  run("traction_clear_snaps_to_defaults", TestTractionClearSnapsToDefaults());
  run("traction_tracks_position", TestTractionTracksPosition());
  run("surface_presets_and_names", TestSurfacePresetsAndNames());
  run("wind_without_tuning_is_calm", TestWindWithoutTuningIsCalm());
  run("steady_wind_settles", TestSteadyWindSettles());
  run("wind_ramps_up", TestWindRampsUp());
  run("gust_cycle", TestGustCycle());
  run("gust_schedule_is_deterministic", TestGustScheduleIsDeterministic());
  run("direction_variance_stays_horizontal",
      TestDirectionVarianceStaysHorizontal());
  run("zone_wind_takes_over", TestZoneWindTakesOver());
  run("set_wind_direction", TestSetWindDirection());
  run("wind_tuning_file", TestWindTuningFile());
  run("find_segment_under", TestFindSegmentUnder());
  run("ground_probe", TestGroundProbe());
  run("track_contains_point", TestTrackContainsPoint());
  run("load_shipped_track", TestLoadShippedTrack());
  run("missing_track_fails", TestMissingTrackFails());
  run("kill_height_ends_run", TestKillHeightEndsRun());
  run("out_of_bounds_grace", TestOutOfBoundsGrace());
  run("in_bounds_rider_never_flagged", TestInBoundsRiderNeverFlagged());
  run("detector_forwards_rider_fall", TestDetectorForwardsRiderFall());
  run("detector_unsubscribes_on_destruction",
      TestDetectorUnsubscribesOnDestruction());
  run("detector_retries_after_immunity", TestDetectorRetriesAfterImmunity());
  run("spawn_places_rider_at_spawn_point",
      TestSpawnPlacesRiderAtSpawnPoint());
  run("swap_rider", TestSwapRider());
  run("spawn_ignored_during_swap", TestSpawnIgnoredDuringSwap());
  run("spawn_without_tuning_fails", TestSpawnWithoutTuningFails());
  run("reset_input_respawns_fallen_rider",
      TestResetInputRespawnsFallenRider());
  run("reset_input_ignored_while_riding", TestResetInputIgnoredWhileRiding());
  run("despawn_clears_rider", TestDespawnClearsRider());
  run("swap_from_fell_listener_waits_for_tick",
      TestSwapFromFellListenerWaitsForTick());
  run("despawn_from_detector_fall_waits_for_manager",
      TestDespawnFromDetectorFallWaitsForManager());
  run("bot_is_deterministic", TestBotIsDeterministic());
  run("cautious_bot_rides_straight_ridge", TestCautiousBotRidesStraightRidge());
  run("bot_requests_reset_when_fallen", TestBotRequestsResetWhenFallen());

  if (failed > 0) {
    std::cerr << failed << " test(s) failed\n";
    return 1;
  }
  std::cout << "All tests passed\n";
  Log::Shutdown();
  return 0;
}
