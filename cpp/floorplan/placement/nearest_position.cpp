#include "floorplan/placement/nearest_position.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/util.h"
#include "floorplan/placement/placement_validator.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

namespace {

float snapHalf(float v) {
    return std::round(v * 2.0f) / 2.0f;
}

} // namespace

std::optional<Point2> findNearestValidPosition(
    const PlacedShape& candidate,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    const SearchOptions& options,
    std::uint32_t excludeId) {
    const float ringRatio = options.maxRadius / options.step;
    if (!(options.step > 0.0f) || !(options.maxRadius >= 0.0f) ||
        !(ringRatio <= static_cast<float>(placement_constants::SEARCH_MAX_RINGS))) {
        FLOORPLAN_LOG_WARN("invalid search options radius=%.3f step=%.3f",
            static_cast<double>(options.maxRadius), static_cast<double>(options.step));
        return std::nullopt;
    }

    PlacedShape probe = candidate;
    if (isValidPlacement(probe, room, others, excludeId).isValid) {
        return candidate.position;
    }

    const Point2 origin = candidate.position;
    const int rings = static_cast<int>(std::floor(ringRatio + 1e-4f));
    for (int i = 1; i <= rings; ++i) {
        const float r = static_cast<float>(i) * options.step;
        const int samples = std::max(
            placement_constants::SEARCH_MIN_SAMPLES,
            static_cast<int>(std::ceil(kTwoPi * r / options.step)));

        for (int k = 0; k < samples; ++k) {
            const float a = kTwoPi * static_cast<float>(k) / static_cast<float>(samples);
            probe.position = {
                snapHalf(origin.x + r * std::cos(a)),
                snapHalf(origin.y + r * std::sin(a)),
            };
            if (isValidPlacement(probe, room, others, excludeId).isValid) {
                return probe.position;
            }
        }
    }

    FLOORPLAN_LOG_DEBUG("no valid position within %.2f of (%.2f, %.2f)",
        static_cast<double>(options.maxRadius), static_cast<double>(origin.x), static_cast<double>(origin.y));
    return std::nullopt;
}

} // namespace floorplan
