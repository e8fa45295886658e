#ifndef FLOORPLAN_CORE_UTIL_H
#define FLOORPLAN_CORE_UTIL_H

#include <cmath>

namespace floorplan {

static constexpr float kPi = 3.14159265358979323846f;
static constexpr float kTwoPi = 2.0f * kPi;

// Maps any angle to [0, 2π).
static inline float normalizeAngle(float radians) noexcept {
    float a = std::fmod(radians, kTwoPi);
    if (a < 0.0f) a += kTwoPi;
    if (a >= kTwoPi) a -= kTwoPi;
    return a;
}

static inline float roundToIncrement(float value, float increment) noexcept {
    if (increment <= 0.0f) return value;
    return std::round(value / increment) * increment;
}

} // namespace floorplan

#endif // FLOORPLAN_CORE_UTIL_H
