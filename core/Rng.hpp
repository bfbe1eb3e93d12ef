#pragma once

#include <cstdint>

namespace core {

// Xorshift32 over caller-owned state. Zero state is remapped to a fixed seed.
uint32_t NextU32(uint32_t &state);

// Uniform in [0, 1].
float NextFloat01(uint32_t &state);

// Uniform in [minValue, maxValue].
float NextRange(uint32_t &state, float minValue, float maxValue);

} // namespace core
