#pragma once

#include <string>
#include <vector>

#include <raylib.h>

#include "sim/Environment.hpp"
#include "sim/TractionManager.hpp"

// A ridge section the rider can stand on.
struct TrackSegment {
  float startZ = 0.0f;
  float length = 10.0f;
  float topY = 0.0f;    // top surface Y
  float width = 4.0f;   // X width
  float xOffset = 0.0f; // lateral shift of segment center
};

// A stretch of track with a special surface, spanning the full width.
struct TrackSurface {
  SurfaceType type = SurfaceType::Gravel;
  float startZ = 0.0f;
  float endZ = 0.0f;
};

struct Track {
  std::string name = "unnamed";
  std::vector<TrackSegment> segments;
  std::vector<TrackSurface> surfaces;
  float spawnZ = -1.0f; // <0 means use the default
  float totalLength = 0.0f;
};

// Loads a track from a JSON file. Returns false (and logs) on failure;
// `track` is reset either way.
bool LoadTrackFromFile(Track &track, const char *path);

// A straight ridge of `count` segments with no gaps.
Track MakeStraightTrack(int count, float segmentLength, float width);

// Index of the segment under (z, x) for a body of half-width `halfW`, or -1.
int FindSegmentUnder(const Track &track, float z, float x, float halfW);

// Spawn Z, falling back to the default when the file sets none.
float GetSpawnZ(const Track &track);
Vector3 GetSpawnPosition(const Track &track);

// Inside some segment's footprint and within its vertical margin.
bool ContainsPoint(const Track &track, Vector3 point);

// Registers one traction zone per surface stretch. Zone bounds span the
// segments under the stretch.
void RegisterTrackSurfaces(const Track &track, TractionManager &traction);

// Ground probe over a track. The track must outlive the probe.
class TrackGroundProbe final : public IGroundProbe {
public:
  explicit TrackGroundProbe(const Track *track) : track(track) {}

  bool HasGroundBelow(Vector3 origin, float distance) const override;

private:
  const Track *track;
};
