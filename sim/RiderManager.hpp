#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <raylib.h>

#include "sim/Environment.hpp"
#include "sim/RiderBase.hpp"
#include "sim/RiderTuning.hpp"
#include "sim/RiderTypes.hpp"

class TractionManager;

// Builds an uninitialized rider of the given type.
std::unique_ptr<RiderBase> CreateRider(RiderType type);

// Owns the active rider and is its only driver: routes input each frame,
// ticks physics each fixed step, and handles spawn, swap and respawn.
class RiderManager {
public:
  using RiderListener = std::function<void(RiderBase &)>;
  using FallListener = std::function<void(FallReason)>;

  RiderManager();
  ~RiderManager();

  RiderManager(const RiderManager &) = delete;
  RiderManager &operator=(const RiderManager &) = delete;

  // Tunings are not owned. Defaults are the reference presets.
  void SetTuning(RiderType type, const RiderTuning *tuning);

  // Applied to every rider spawned afterwards and to the active one.
  void SetEnvironment(const RiderEnvironment &env);

  // Zones on this provider are cleared on every respawn. Not owned.
  void SetTractionManager(TractionManager *traction) { tractionManager = traction; }

  void SetSpawnPoint(Vector3 position, Quaternion rotation);

  // Replaces any active rider. Ignored while a spawn or despawn is running.
  // Spawn, despawn and swap requested while the rider is ticking or
  // dispatching its fall are queued and applied once the tick has returned
  // (end of FixedUpdate/Update, or the start of the next one). Only the
  // latest request is kept.
  void SpawnRider(RiderType type);
  void DespawnCurrentRider();

  // No-op if `type` is already active.
  void SwapRider(RiderType type);

  // Puts the active rider back at the spawn point with respawn immunity.
  void RespawnCurrentRider();

  // Once per rendered frame. A reset press while fallen respawns.
  void Update(const InputState &input, float frameDt);

  // Once per fixed physics step.
  void FixedUpdate(float deltaTime);

  RiderBase *ActiveRider() { return activeRider.get(); }
  const RiderBase *ActiveRider() const { return activeRider.get(); }
  RiderType CurrentRiderType() const { return currentType; }
  bool IsSwapping() const { return isSwapping; }
  bool HasPendingRequest() const { return pending.kind != PendingKind::None; }
  int RespawnCount() const { return respawnCount; }

  void AddSpawnedListener(RiderListener listener);
  void AddDespawnedListener(RiderListener listener);
  void AddFellListener(FallListener listener);

private:
  enum class PendingKind { None, Spawn, Swap, Despawn };
  struct PendingRequest {
    PendingKind kind = PendingKind::None;
    RiderType type = RiderType::Bike;
  };

  void Defer(PendingKind kind, RiderType type);
  void ApplyPendingRequest();
  void DespawnInternal();
  const RiderTuning *TuningFor(RiderType type) const;

  std::unique_ptr<RiderBase> activeRider;
  RiderBase::ListenerId fallListenerId = 0;
  RiderType currentType = RiderType::Bike;
  bool isSwapping = false;
  int busyDepth = 0;
  PendingRequest pending{};
  int respawnCount = 0;

  const RiderTuning *bikeTuning = nullptr;
  const RiderTuning *horseTuning = nullptr;
  RiderEnvironment environment{};
  TractionManager *tractionManager = nullptr;

  Vector3 spawnPosition{0.0f, 0.0f, 0.0f};
  Quaternion spawnRotation{0.0f, 0.0f, 0.0f, 1.0f};

  std::vector<RiderListener> spawnedListeners;
  std::vector<RiderListener> despawnedListeners;
  std::vector<FallListener> fellListeners;
};
