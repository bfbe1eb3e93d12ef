#include "sim/Track.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>

#include "core/Config.hpp"
#include "core/Log.hpp"

using json = nlohmann::json;

namespace {

SurfaceType GetSurfaceType(const json &j, const char *key,
                           const SurfaceType defaultVal) {
  if (!j.contains(key)) {
    return defaultVal;
  }
  const auto &val = j[key];
  if (val.is_number()) {
    return static_cast<SurfaceType>(val.get<int>());
  }
  SurfaceType parsed = defaultVal;
  if (val.is_string() &&
      ParseSurfaceType(val.get<std::string>().c_str(), parsed)) {
    return parsed;
  }
  LOG_WARN("Unknown surface type in track, using default");
  return defaultVal;
}

void UpdateTotalLength(Track &track) {
  track.totalLength = 0.0f;
  for (const auto &s : track.segments) {
    track.totalLength = std::max(track.totalLength, s.startZ + s.length);
  }
}

} // namespace

bool LoadTrackFromFile(Track &track, const char *path) {
  track = {};

  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("Failed to open track file: {}", path);
    return false;
  }

  try {
    const json data = json::parse(f);

    track.name = data.value("name", std::string("unnamed"));
    track.spawnZ = data.value("spawnZ", -1.0f);

    if (data.contains("segments") && data["segments"].is_array()) {
      for (const auto &s_json : data["segments"]) {
        TrackSegment s{};
        s.startZ = s_json.value("startZ", 0.0f);
        s.length = s_json.value("length", 10.0f);
        s.topY = s_json.value("topY", 0.0f);
        s.width = s_json.value("width", 4.0f);
        s.xOffset = s_json.value("xOffset", 0.0f);
        if (s.length <= 0.0f || s.width <= 0.0f) {
          LOG_WARN("Skipping degenerate segment at z={} in {}", s.startZ,
                   path);
          continue;
        }
        track.segments.push_back(s);
      }
    }

    if (data.contains("surfaces") && data["surfaces"].is_array()) {
      for (const auto &z_json : data["surfaces"]) {
        TrackSurface z{};
        z.type = GetSurfaceType(z_json, "type", SurfaceType::Gravel);
        z.startZ = z_json.value("startZ", 0.0f);
        z.endZ = z_json.value("endZ", z.startZ);
        track.surfaces.push_back(z);
      }
    }

    if (track.segments.empty()) {
      LOG_ERROR("Track {} has no segments", path);
      return false;
    }

    UpdateTotalLength(track);
    LOG_INFO("Loaded track '{}' from {}: {} segments, {} surfaces, {:.0f}m",
             track.name, path, track.segments.size(), track.surfaces.size(),
             track.totalLength);
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("JSON error in {}: {}", path, e.what());
    track = {};
    return false;
  }
}

Track MakeStraightTrack(const int count, const float segmentLength,
                        const float width) {
  Track track{};
  track.name = "straight";
  for (int i = 0; i < count; ++i) {
    TrackSegment s{};
    s.startZ = static_cast<float>(i) * segmentLength;
    s.length = segmentLength;
    s.width = width;
    track.segments.push_back(s);
  }
  UpdateTotalLength(track);
  return track;
}

int FindSegmentUnder(const Track &track, const float z, const float x,
                     const float halfW) {
  for (int i = 0; i < static_cast<int>(track.segments.size()); ++i) {
    const auto &s = track.segments[static_cast<size_t>(i)];
    const float endZ = s.startZ + s.length;
    if (z < s.startZ || z > endZ) {
      continue;
    }
    const float segLeft = s.xOffset - s.width * 0.5f;
    const float segRight = s.xOffset + s.width * 0.5f;
    if (x + halfW < segLeft || x - halfW > segRight) {
      continue;
    }
    return i;
  }
  return -1;
}

float GetSpawnZ(const Track &track) {
  if (track.spawnZ < 0.0f) {
    return cfg::kDefaultSpawnZ;
  }
  return track.spawnZ;
}

Vector3 GetSpawnPosition(const Track &track) {
  const float z = GetSpawnZ(track);
  const int seg = FindSegmentUnder(track, z, 0.0f, 0.0f);
  if (seg < 0) {
    return Vector3{0.0f, 0.0f, z};
  }
  const auto &s = track.segments[static_cast<size_t>(seg)];
  return Vector3{s.xOffset, s.topY, z};
}

bool ContainsPoint(const Track &track, const Vector3 point) {
  // Bounds are the bare footprint; the rider's width is not added here.
  const int seg = FindSegmentUnder(track, point.z, point.x, 0.0f);
  if (seg < 0) {
    return false;
  }
  const auto &s = track.segments[static_cast<size_t>(seg)];
  return point.y >= s.topY - cfg::kTrackBoundsBelow &&
         point.y <= s.topY + cfg::kTrackBoundsAbove;
}

void RegisterTrackSurfaces(const Track &track, TractionManager &traction) {
  for (const auto &surface : track.surfaces) {
    float minX = 0.0f;
    float maxX = 0.0f;
    float minY = 0.0f;
    float maxY = 0.0f;
    bool any = false;
    for (const auto &s : track.segments) {
      if (s.startZ + s.length < surface.startZ || s.startZ > surface.endZ) {
        continue;
      }
      const float left = s.xOffset - s.width * 0.5f;
      const float right = s.xOffset + s.width * 0.5f;
      if (!any) {
        minX = left;
        maxX = right;
        minY = s.topY;
        maxY = s.topY;
        any = true;
      } else {
        minX = std::min(minX, left);
        maxX = std::max(maxX, right);
        minY = std::min(minY, s.topY);
        maxY = std::max(maxY, s.topY);
      }
    }
    if (!any) {
      LOG_WARN("Surface stretch {:.1f}-{:.1f} has no segment under it",
               surface.startZ, surface.endZ);
      continue;
    }

    TractionZone zone = MakeSurfaceZone(surface.type);
    zone.bounds.min = Vector3{minX, minY - 1.0f, surface.startZ};
    zone.bounds.max = Vector3{maxX, maxY + 2.0f, surface.endZ};
    traction.RegisterZone(zone);
  }
}

bool TrackGroundProbe::HasGroundBelow(const Vector3 origin,
                                      const float distance) const {
  if (track == nullptr) {
    return false;
  }
  const int seg =
      FindSegmentUnder(*track, origin.z, origin.x, cfg::kRiderHalfWidth);
  if (seg < 0) {
    return false;
  }
  const float topY = track->segments[static_cast<size_t>(seg)].topY;
  return std::fabs(origin.y - topY) <= distance;
}
