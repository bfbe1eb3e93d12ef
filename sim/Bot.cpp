#include "sim/Bot.hpp"

#include <cmath>
#include <cstring>

#include "core/Rng.hpp"
#include "sim/RiderBase.hpp"
#include "sim/SimMath.hpp"
#include "sim/Track.hpp"

bool ParseBotStyle(const char *text, BotStyle &out) {
  if (text == nullptr) {
    return false;
  }
  if (std::strcmp(text, "cautious") == 0) {
    out = BotStyle::Cautious;
  } else if (std::strcmp(text, "aggressive") == 0) {
    out = BotStyle::Aggressive;
  } else if (std::strcmp(text, "random") == 0) {
    out = BotStyle::Random;
  } else {
    return false;
  }
  return true;
}

const char *BotStyleName(const BotStyle style) {
  switch (style) {
  case BotStyle::Cautious:
    return "cautious";
  case BotStyle::Aggressive:
    return "aggressive";
  case BotStyle::Random:
    return "random";
  }
  return "unknown";
}

void InitBot(Bot &bot, const BotStyle style, const uint32_t seed) {
  bot.style = style;
  bot.rng = (seed == 0u) ? 1u : seed;
  bot.ticksSinceFocus = 0;
}

// Centre X of the ridge `lookAhead` units ahead of `z`.
static float SegmentCenterAhead(const Track *track, const float z,
                                const float lookAhead) {
  if (track == nullptr) {
    return 0.0f;
  }
  const float checkZ = z + lookAhead;
  for (const auto &s : track->segments) {
    if (checkZ >= s.startZ && checkZ <= s.startZ + s.length) {
      return s.xOffset;
    }
  }
  // Past the end: keep to the last segment.
  if (!track->segments.empty()) {
    return track->segments.back().xOffset;
  }
  return 0.0f;
}

// Steer in [-1, 1] that turns the heading toward (targetX, z + lookAhead).
static float SteerToward(const RiderBase &rider, const float targetX,
                         const float lookAhead, const float gain) {
  const RiderBody &body = rider.Body();
  const float dx = targetX - body.position.x;
  const float desiredYaw = std::atan2(dx, lookAhead) * RAD2DEG;
  const float yawError = desiredYaw - body.yawDeg;
  return simmath::Clamp(yawError * gain, -1.0f, 1.0f);
}

InputState BotInput(Bot &bot, const RiderBase &rider, const Track *track) {
  ++bot.ticksSinceFocus;

  InputState input = InputState::Empty();
  if (rider.HasFallen()) {
    input.resetPressed = true;
    return input;
  }

  const float z = rider.Body().position.z;
  const float stability = rider.Stability();

  switch (bot.style) {

  case BotStyle::Cautious: {
    const float targetX = SegmentCenterAhead(track, z, 10.0f);
    input.steer = SteerToward(rider, targetX, 10.0f, 0.05f);
    input.throttle = (stability > 0.6f) ? 0.7f : 0.4f;
    if (stability < 0.5f) {
      input.focusHeld = true;
      bot.ticksSinceFocus = 0;
    }
    if (stability < 0.3f) {
      input.throttle = 0.0f;
      input.brake = 0.5f;
    }
    break;
  }

  case BotStyle::Aggressive: {
    const float targetX = SegmentCenterAhead(track, z, 6.0f);
    input.steer = SteerToward(rider, targetX, 6.0f, 0.1f);
    input.throttle = 1.0f;
    // Short focus bursts only when close to the edge of balance.
    if (stability < 0.3f && bot.ticksSinceFocus > 30) {
      input.focusHeld = true;
      bot.ticksSinceFocus = 0;
    }
    break;
  }

  case BotStyle::Random: {
    const float r1 = core::NextFloat01(bot.rng);
    const float r2 = core::NextFloat01(bot.rng);
    const float r3 = core::NextFloat01(bot.rng);

    const float targetX = SegmentCenterAhead(track, z, 8.0f);
    input.steer = SteerToward(rider, targetX, 8.0f, 0.05f) + (r1 - 0.5f);
    input.throttle = 0.5f + r2 * 0.5f;
    input.brake = (r3 < 0.05f) ? 1.0f : 0.0f;
    input.focusHeld = r3 > 0.9f;
    break;
  }

  } // switch

  input.steer = simmath::Clamp(input.steer, -1.0f, 1.0f);
  return input;
}
