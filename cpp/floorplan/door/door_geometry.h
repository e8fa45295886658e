#pragma once

#include "floorplan/core/types.h"
#include "floorplan/layout/layout_types.h"

#include <optional>

namespace floorplan {

// Door line, hinge and swing arc for a door on the wall v1 -> v2.
// `position` is read according to `anchor`; a zero-length wall or a
// non-positive width has no geometry.
//
// The swing starts on the +90° side of the wall direction and flips for
// Inward. Rings in engine winding keep the interior on the -90° side, so
// Inward swings into the room.
std::optional<DoorGeometry> doorGeometry(
    const Point2& v1,
    const Point2& v2,
    float position,
    DoorAnchor anchor,
    float width,
    HingeSide hingeSide,
    OpenDirection openDirection) noexcept;

// World-frame geometry for a door of `room`. Inward always swings into the
// room, whichever way the ring is wound. Unknown wall index -> nullopt.
std::optional<DoorGeometry> doorGeometryForRoom(const DoorRec& door, const RoomRec& room);

// Inside the swing disk and within the quarter arc traced from openEnd to swingEndPoint.
bool pointInDoorSwing(const Point2& p, const DoorGeometry& geometry) noexcept;

// Direction whose swing enters `ring`, for rings of either winding.
OpenDirection interiorOpenDirection(const Point2& wallStart, const Point2& wallEnd, const Ring& ring) noexcept;

} // namespace floorplan
