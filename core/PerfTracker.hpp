#pragma once

#include <atomic>

// Heap allocation counter for the physics loop.
// Active only in debug builds (NDEBUG not defined); release builds read 0.
// Call ResetAllocCounter() before a batch of ticks, ReadAllocCounter() after.

namespace perf {

#ifndef NDEBUG

inline std::atomic<int> g_allocCounter{0};

inline void ResetAllocCounter() { g_allocCounter.store(0, std::memory_order_relaxed); }
inline int  ReadAllocCounter()  { return g_allocCounter.load(std::memory_order_relaxed); }
inline bool AllocCounterEnabled() { return true; }

#else

inline void ResetAllocCounter() {}
inline int  ReadAllocCounter()  { return 0; }
inline bool AllocCounterEnabled() { return false; }

#endif

}  // namespace perf
