#ifndef FLOORPLAN_LAYOUT_LAYOUT_TYPES_H
#define FLOORPLAN_LAYOUT_LAYOUT_TYPES_H

#include "floorplan/core/types.h"
#include "floorplan/shape/shape_template.h"

#include <cstdint>
#include <string>
#include <vector>

namespace floorplan {

// Room vertices are room-local; `position` places them in the world.
struct RoomRec {
    std::uint32_t id{kNoId};
    std::string name;
    Ring vertices;
    Point2 position{0.0f, 0.0f};
    std::vector<DoorRec> doors;
};

// Furniture positions are relative to the owning room's origin.
struct FurnitureRec {
    std::uint32_t id{kNoId};
    std::uint32_t roomId{kNoId};
    std::string name;
    PlacedShape shape;
};

// World-frame item as seen by the validator.
struct PlacedItem {
    std::uint32_t id{kNoId};
    PlacedShape shape;
};

struct LayoutSnapshot {
    std::vector<RoomRec> rooms;
    std::vector<FurnitureRec> furniture;
};

// Resolves `shape` (room-local, rotation 0) into a room placed at `position`.
RoomRec makeRoom(std::uint32_t id, const ShapeTemplate& shape, const Point2& position, std::string name = {});

Ring roomWorldRing(const RoomRec& room);

const RoomRec* findRoom(const std::vector<RoomRec>& rooms, std::uint32_t id) noexcept;
const FurnitureRec* findFurniture(const std::vector<FurnitureRec>& furniture, std::uint32_t id) noexcept;

} // namespace floorplan

#endif // FLOORPLAN_LAYOUT_LAYOUT_TYPES_H
