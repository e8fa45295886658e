#pragma once

#include "floorplan/core/types.h"
#include "floorplan/layout/layout_types.h"
#include "floorplan/shape/shape_template.h"

#include <cstdint>
#include <vector>

namespace floorplan {

// Checks a world-frame candidate against its room, the other items and the
// room's door swings. Reasons are appended in that order, each at most once.
// `excludeId` skips one entry of `others` (the item's own pre-drag state).
PlacementVerdict isValidPlacement(
    const PlacedShape& candidate,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    std::uint32_t excludeId = kNoId);

// Individual checks, exposed for callers that only need one answer.
bool fitsInsideRoom(const PlacedShape& candidate, const Ring& roomRing);
bool overlapsAny(const PlacedShape& candidate, const std::vector<PlacedItem>& others, std::uint32_t excludeId);
bool intrudesDoorSwing(const PlacedShape& candidate, const RoomRec& room);

} // namespace floorplan
