#include "sim/RiderTypes.hpp"

#include <cctype>
#include <string>

const char *FallReasonName(const FallReason reason) {
  switch (reason) {
  case FallReason::LostBalance:
    return "LostBalance";
  case FallReason::Collision:
    return "Collision";
  case FallReason::FellOffEdge:
    return "FellOffEdge";
  case FallReason::Overspeed:
    return "Overspeed";
  case FallReason::ExternalForce:
    return "ExternalForce";
  }
  return "Unknown";
}

const char *RiderTypeName(const RiderType type) {
  switch (type) {
  case RiderType::Bike:
    return "Bike";
  case RiderType::Horse:
    return "Horse";
  }
  return "Unknown";
}

bool ParseRiderType(const char *text, RiderType &out) {
  if (text == nullptr) {
    return false;
  }
  std::string lower(text);
  for (auto &c : lower) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "bike") {
    out = RiderType::Bike;
    return true;
  }
  if (lower == "horse") {
    out = RiderType::Horse;
    return true;
  }
  return false;
}

const char *RiderStateName(const RiderState state) {
  switch (state) {
  case RiderState::Inert:
    return "Inert";
  case RiderState::Active:
    return "Active";
  case RiderState::RespawnImmune:
    return "RespawnImmune";
  case RiderState::Fallen:
    return "Fallen";
  }
  return "Unknown";
}
