#pragma once

#include "floorplan/core/engine_config.h"
#include "floorplan/core/types.h"
#include "floorplan/layout/layout_types.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace floorplan {

// round(value / gridSize) * gridSize; gridSize <= 0 leaves the value alone.
float snapToGrid(float value, float gridSize) noexcept;
Point2 snapPointToGrid(const Point2& p, float gridSize) noexcept;

struct RoomSnapResult {
    Point2 position{0.0f, 0.0f};
    float dx{0.0f};
    float dy{0.0f};
    bool snappedX{false};
    bool snappedY{false};
};

// Aligns the moving room's vertical walls with other vertical walls (x) and
// horizontal walls with horizontal walls (y). Each axis takes the smallest
// correction within `threshold`; nullopt when neither axis snaps.
std::optional<RoomSnapResult> findRoomSnapPosition(
    const Ring& movingRing,
    const Point2& position,
    const std::vector<RoomRec>& otherRooms,
    float threshold = placement_constants::ROOM_SNAP_DISTANCE);

// Grid snap, then room-to-room snap against every room except `roomId`.
// Unknown room ids return `rawPosition` untouched.
Point2 calculateSnappedRoomPosition(
    const std::vector<RoomRec>& rooms,
    std::uint32_t roomId,
    const Point2& rawPosition,
    float gridSize,
    float threshold);

struct WallSnapResult {
    std::uint32_t wallIndex{0};
    float positionOnWall{0.0f}; // door start offset from the wall start
    float centerOffset{0.0f};   // door center offset from the wall start
    float fraction{0.0f};       // centerOffset / wall length
    Point2 point{0.0f, 0.0f};   // door center
    float wallAngle{0.0f};      // radians
    float distance{0.0f};       // cursor to wall
};

// Nearest wall to `worldPoint` within `maxDistance`, with the door kept fully
// on the wall.
std::optional<WallSnapResult> findClosestWallPoint(
    const Point2& worldPoint,
    const std::vector<WallSegment>& walls,
    float doorWidth,
    float maxDistance = placement_constants::WALL_SNAP_DISTANCE);

} // namespace floorplan
