#include "floorplan/core/types.h"

namespace floorplan {

const char* violationMessage(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::OutsideRoom: return "Furniture extends outside room boundaries";
        case ViolationKind::FurnitureOverlap: return "Furniture collides with existing furniture";
        case ViolationKind::DoorSwing: return "Furniture blocks a door swing";
        case ViolationKind::RoomOverlap: return "Room overlaps another room";
        default: return "Unknown placement violation";
    }
}

} // namespace floorplan
