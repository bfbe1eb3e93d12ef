#include "sim/RiderManager.hpp"

#include <utility>

#include "core/Log.hpp"
#include "sim/BikeRider.hpp"
#include "sim/HorseRider.hpp"
#include "sim/TractionManager.hpp"

namespace {

// Clears a flag on scope exit, including early returns.
struct SwapGuard {
  explicit SwapGuard(bool &flag) : flag(flag) { flag = true; }
  ~SwapGuard() { flag = false; }
  bool &flag;
};

// Counts nested scopes that hold a reference to the active rider.
struct BusyScope {
  explicit BusyScope(int &depth) : depth(depth) { ++depth; }
  ~BusyScope() { --depth; }
  int &depth;
};

} // namespace

std::unique_ptr<RiderBase> CreateRider(const RiderType type) {
  switch (type) {
  case RiderType::Bike:
    return std::make_unique<BikeRider>();
  case RiderType::Horse:
    return std::make_unique<HorseRider>();
  }
  return nullptr;
}

RiderManager::RiderManager()
    : bikeTuning(&GetBikeTuning()), horseTuning(&GetHorseTuning()) {}

RiderManager::~RiderManager() {
  // Listeners are not told about teardown.
  if (activeRider) {
    activeRider->RemoveFallListener(fallListenerId);
  }
}

void RiderManager::SetTuning(const RiderType type, const RiderTuning *tuning) {
  if (type == RiderType::Bike) {
    bikeTuning = tuning;
  } else {
    horseTuning = tuning;
  }
}

void RiderManager::SetEnvironment(const RiderEnvironment &env) {
  environment = env;
  if (activeRider) {
    activeRider->SetEnvironment(environment);
  }
}

void RiderManager::SetSpawnPoint(const Vector3 position,
                                 const Quaternion rotation) {
  spawnPosition = position;
  spawnRotation = rotation;
}

const RiderTuning *RiderManager::TuningFor(const RiderType type) const {
  return (type == RiderType::Bike) ? bikeTuning : horseTuning;
}

void RiderManager::SpawnRider(const RiderType type) {
  if (busyDepth > 0) {
    Defer(PendingKind::Spawn, type);
    return;
  }
  if (isSwapping) {
    LOG_WARN("RiderManager: spawn of {} ignored during swap",
             RiderTypeName(type));
    return;
  }
  SwapGuard guard(isSwapping);

  if (activeRider) {
    DespawnInternal();
  }

  const RiderTuning *tuning = TuningFor(type);
  if (tuning == nullptr) {
    LOG_ERROR("RiderManager: no tuning assigned for rider type {}",
              RiderTypeName(type));
    return;
  }

  std::unique_ptr<RiderBase> rider = CreateRider(type);
  if (!rider) {
    LOG_ERROR("RiderManager: cannot create rider type {}",
              static_cast<int>(type));
    return;
  }

  rider->SetEnvironment(environment);
  rider->Initialize(tuning);
  rider->ResetRider(spawnPosition, spawnRotation);
  fallListenerId = rider->AddFallListener([this](FallReason reason) {
    BusyScope dispatching(busyDepth);
    const auto listeners = fellListeners;
    for (const auto &listener : listeners) {
      listener(reason);
    }
  });

  activeRider = std::move(rider);
  currentType = type;
  LOG_INFO("RiderManager: spawned {} ({})", RiderTypeName(type),
           tuning->riderName);

  const auto listeners = spawnedListeners;
  for (const auto &listener : listeners) {
    listener(*activeRider);
  }
}

void RiderManager::DespawnCurrentRider() {
  if (busyDepth > 0) {
    Defer(PendingKind::Despawn, currentType);
    return;
  }
  if (isSwapping) {
    return;
  }
  SwapGuard guard(isSwapping);
  DespawnInternal();
}

void RiderManager::SwapRider(const RiderType type) {
  if (busyDepth > 0) {
    Defer(PendingKind::Swap, type);
    return;
  }
  if (activeRider && type == currentType) {
    return;
  }
  SpawnRider(type);
}

void RiderManager::RespawnCurrentRider() {
  if (!activeRider) {
    return;
  }

  if (tractionManager != nullptr) {
    tractionManager->ClearAllZones();
  }
  activeRider->ResetRider(spawnPosition, spawnRotation);
  ++respawnCount;
  LOG_DEBUG("RiderManager: respawned {} (#{})", RiderTypeName(currentType),
            respawnCount);
}

void RiderManager::Update(const InputState &input, const float frameDt) {
  ApplyPendingRequest();
  if (activeRider) {
    BusyScope ticking(busyDepth);
    activeRider->TickInput(input, frameDt);

    if (input.resetPressed && activeRider->HasFallen()) {
      RespawnCurrentRider();
    }
  }
  ApplyPendingRequest();
}

void RiderManager::FixedUpdate(const float deltaTime) {
  ApplyPendingRequest();
  if (activeRider) {
    BusyScope ticking(busyDepth);
    activeRider->TickPhysics(deltaTime);
  }
  ApplyPendingRequest();
}

void RiderManager::Defer(const PendingKind kind, const RiderType type) {
  if (pending.kind != PendingKind::None) {
    LOG_DEBUG("RiderManager: pending rider change replaced");
  }
  pending.kind = kind;
  pending.type = type;
}

void RiderManager::ApplyPendingRequest() {
  if (busyDepth > 0 || pending.kind == PendingKind::None) {
    return;
  }

  const PendingRequest request = pending;
  pending = PendingRequest{};
  switch (request.kind) {
  case PendingKind::Spawn:
    SpawnRider(request.type);
    break;
  case PendingKind::Swap:
    SwapRider(request.type);
    break;
  case PendingKind::Despawn:
    DespawnCurrentRider();
    break;
  case PendingKind::None:
    break;
  }
}

void RiderManager::DespawnInternal() {
  if (!activeRider) {
    return;
  }

  activeRider->RemoveFallListener(fallListenerId);
  fallListenerId = 0;

  const auto listeners = despawnedListeners;
  for (const auto &listener : listeners) {
    listener(*activeRider);
  }

  activeRider.reset();
}

void RiderManager::AddSpawnedListener(RiderListener listener) {
  spawnedListeners.push_back(std::move(listener));
}

void RiderManager::AddDespawnedListener(RiderListener listener) {
  despawnedListeners.push_back(std::move(listener));
}

void RiderManager::AddFellListener(FallListener listener) {
  fellListeners.push_back(std::move(listener));
}
