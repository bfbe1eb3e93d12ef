#pragma once

// Data file path helpers.
// Resolves paths against the nearest 'assets' directory found in the working
// directory or up to three of its parents, so the runner and the tests work
// from both the project root and a build directory.
//
// Usage:
//   RiderTuning bike;
//   LoadRiderTuningFromFile(bike, assets::Path("tuning/bike.json"));

namespace assets {

// Returns "<assets dir>/<relative>". The buffer is thread_local and is
// overwritten by the next call on the same thread.
const char* Path(const char* relative);

// True if the resolved asset file exists.
bool Exists(const char* relative);

}  // namespace assets
