#pragma once

#include <cstdint>

#include "sim/RiderTypes.hpp"

class RiderBase;
struct Track;

// Bot behavior presets.
enum class BotStyle {
  Cautious,   // moderate throttle, holds focus when shaky
  Aggressive, // full throttle, hard corrections
  Random,     // seeded random inputs for stress testing
};

// Accepts "cautious", "aggressive" or "random".
bool ParseBotStyle(const char *text, BotStyle &out);
const char *BotStyleName(BotStyle style);

// Deterministic bot that produces one frame of rider input.
// Uses its own RNG state so it doesn't disturb the wind seed.
struct Bot {
  BotStyle style = BotStyle::Cautious;
  uint32_t rng = 1u;
  int ticksSinceFocus = 0;
};

void InitBot(Bot &bot, BotStyle style, uint32_t seed);

// Steers back toward the centre of the ridge ahead. `track` may be null, in
// which case the bot holds x = 0.
InputState BotInput(Bot &bot, const RiderBase &rider, const Track *track);
