#pragma once

#include "floorplan/core/engine_config.h"
#include "floorplan/core/types.h"

#include <vector>

namespace floorplan {

// One segment per consecutive vertex pair, the last closing back to the first.
// `worldOffset` moves a room-local ring into world coordinates. Rings with
// fewer than two points have no walls.
std::vector<WallSegment> wallSegments(
    const Ring& ring,
    const Point2& worldOffset = { 0.0f, 0.0f },
    float measurementIncrement = placement_constants::MEASUREMENT_INCREMENT);

WallOrientation classifyWall(const Point2& a, const Point2& b) noexcept;

} // namespace floorplan
