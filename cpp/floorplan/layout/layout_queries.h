#pragma once

#include "floorplan/core/types.h"
#include "floorplan/layout/layout_types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace floorplan {

// Room-relative furniture -> world frame.
PlacedItem worldPlacement(const FurnitureRec& furniture, const RoomRec& room);

// Every item of the layout whose room exists, in world frame, skipping `excludeId`.
std::vector<PlacedItem> worldItems(const LayoutSnapshot& layout, std::uint32_t excludeId = kNoId);

// =============================================================================
// Rooms
// =============================================================================

// Interior overlap between room `roomId` moved to `position` and any other
// room. Flush rooms do not collide. Unknown ids never collide.
bool checkRoomCollision(const std::vector<RoomRec>& rooms, std::uint32_t roomId, const Point2& position);

PlacementVerdict validateRoomPlacement(const std::vector<RoomRec>& rooms, std::uint32_t roomId, const Point2& position);

// =============================================================================
// Furniture
// =============================================================================

// Validates furniture `furnitureId` at room-relative `position` inside room
// `roomId`, against every other item of the layout. Unknown ids collide.
bool checkFurnitureCollision(
    const LayoutSnapshot& layout,
    std::uint32_t furnitureId,
    const Point2& position,
    std::uint32_t roomId);

bool canRotate(
    const PlacedShape& placed,
    Rotation rotation,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    std::uint32_t excludeId = kNoId);

std::vector<Rotation> validRotations(
    const PlacedShape& placed,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    std::uint32_t excludeId = kNoId);

// =============================================================================
// Hit Testing
// =============================================================================

// Id of the top-most (last listed) room containing `point`, or kNoId.
std::uint32_t hitTestRoom(const Point2& point, const std::vector<RoomRec>& rooms);

// Id of the top-most (last listed) furniture item containing `point`, or kNoId.
std::uint32_t hitTestFurniture(const Point2& point, const LayoutSnapshot& layout);

// =============================================================================
// Measurements
// =============================================================================

// Smallest vertex-to-wall distance; 0 when either input is empty.
float furnitureWallClearance(const PlacedShape& placed, const Ring& roomRing);

enum class ObstacleKind : std::uint8_t { Wall = 0, Furniture = 1 };

struct NamedRing {
    Ring vertices;
    std::string name;
};

struct DistanceMeasurement {
    float distance;
    Point2 furniturePoint;
    Point2 obstaclePoint;
    ObstacleKind obstacleKind;
    std::string obstacleName;
};

// Up to `count` shortest gaps between the furniture outline and the walls or
// other outlines, nearest first. Gaps under an inch and gaps pointing the same
// way as an already chosen one are dropped.
std::vector<DistanceMeasurement> findNearestDistances(
    const Ring& furnitureRing,
    const Ring& roomRing,
    const std::vector<NamedRing>& others,
    std::size_t count = 2);

// Outline used for hit testing and measurements (circles approximated).
Ring outlineRing(const PlacedShape& placed);

} // namespace floorplan
