#include "floorplan/layout/layout_types.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/shape/shape_resolution.h"

#include <utility>

namespace floorplan {

RoomRec makeRoom(std::uint32_t id, const ShapeTemplate& shape, const Point2& position, std::string name) {
    RoomRec room;
    room.id = id;
    room.name = std::move(name);
    room.vertices = resolveRing(shape, Rotation::Deg0, { 0.0f, 0.0f });
    room.position = position;
    return room;
}

Ring roomWorldRing(const RoomRec& room) {
    return translateRing(room.vertices, room.position);
}

const RoomRec* findRoom(const std::vector<RoomRec>& rooms, std::uint32_t id) noexcept {
    for (const RoomRec& r : rooms) {
        if (r.id == id) return &r;
    }
    return nullptr;
}

const FurnitureRec* findFurniture(const std::vector<FurnitureRec>& furniture, std::uint32_t id) noexcept {
    for (const FurnitureRec& f : furniture) {
        if (f.id == id) return &f;
    }
    return nullptr;
}

} // namespace floorplan
