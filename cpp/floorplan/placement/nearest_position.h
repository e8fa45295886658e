#pragma once

#include "floorplan/core/engine_config.h"
#include "floorplan/core/types.h"
#include "floorplan/layout/layout_types.h"
#include "floorplan/shape/shape_template.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace floorplan {

struct SearchOptions {
    float maxRadius = placement_constants::SEARCH_RADIUS;
    float step = placement_constants::SEARCH_STEP;
};

inline SearchOptions searchOptionsFrom(const EngineConfig& config) {
    return { config.searchRadius, config.searchStep };
}

// Scans rings of radius 0, step, 2*step ... maxRadius around the candidate's
// position and returns the first valid `position`, snapped to the half-inch
// grid. nullopt when every ring is exhausted.
std::optional<Point2> findNearestValidPosition(
    const PlacedShape& candidate,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    const SearchOptions& options = {},
    std::uint32_t excludeId = kNoId);

} // namespace floorplan
