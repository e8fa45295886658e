#include "floorplan/placement/placement_validator.h"
#include "floorplan/core/engine_config.h"
#include "floorplan/core/logging.h"
#include "floorplan/door/door_geometry.h"
#include "floorplan/furniture/furniture_decomposition.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/shape/shape_resolution.h"

namespace floorplan {

namespace {

bool circleInsideRing(const Point2& center, float radius, const Ring& ring) {
    if (!pointInPolygon(center, ring)) return false;
    const std::size_t n = ring.size();
    for (std::size_t i = 0; i < n; ++i) {
        const float d = distancePointToSegment(center, ring[i], ring[(i + 1) % n]);
        if (d < radius - placement_constants::BOUNDARY_EPSILON) return false;
    }
    return true;
}

bool partsInsideRing(const std::vector<CollisionPart>& parts, const Ring& ring) {
    const float eps = placement_constants::BOUNDARY_EPSILON;
    for (const CollisionPart& part : parts) {
        if (part.kind == CollisionPartKind::Circle) {
            if (!circleInsideRing(part.center, part.radius, ring)) return false;
            continue;
        }
        for (const Point2& corner : partCorners(part)) {
            if (!pointInOrOnPolygon(corner, ring, eps)) return false;
        }
    }
    return true;
}

} // namespace

bool fitsInsideRoom(const PlacedShape& candidate, const Ring& roomRing) {
    if (roomRing.size() < 3) return false;
    if (!pointInPolygon(placedCenter(candidate), roomRing)) return false;
    return partsInsideRing(collisionParts(candidate), roomRing);
}

bool overlapsAny(const PlacedShape& candidate, const std::vector<PlacedItem>& others, std::uint32_t excludeId) {
    const std::vector<CollisionPart> mine = collisionParts(candidate);
    for (const PlacedItem& other : others) {
        if (excludeId != kNoId && other.id == excludeId) continue;
        const std::vector<CollisionPart> theirs = collisionParts(other.shape);
        for (const CollisionPart& a : mine) {
            for (const CollisionPart& b : theirs) {
                if (partsOverlap(a, b)) {
                    FLOORPLAN_LOG_DEBUG("candidate overlaps item %u", other.id);
                    return true;
                }
            }
        }
    }
    return false;
}

bool intrudesDoorSwing(const PlacedShape& candidate, const RoomRec& room) {
    if (room.doors.empty()) return false;

    // Corners of each part's rect plus the part centers and the item center.
    std::vector<Point2> samples;
    const std::vector<CollisionPart> parts = collisionParts(candidate);
    for (const CollisionPart& part : parts) {
        for (const Point2& corner : rectRing(part.rect)) samples.push_back(corner);
        samples.push_back(part.center);
    }
    samples.push_back(placedCenter(candidate));

    for (const DoorRec& door : room.doors) {
        const auto geometry = doorGeometryForRoom(door, room);
        if (!geometry) continue;
        for (const Point2& p : samples) {
            if (pointInDoorSwing(p, *geometry)) {
                FLOORPLAN_LOG_DEBUG("candidate enters swing of door %u", door.id);
                return true;
            }
        }
    }
    return false;
}

PlacementVerdict isValidPlacement(
    const PlacedShape& candidate,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    std::uint32_t excludeId) {
    PlacementVerdict verdict;

    if (!fitsInsideRoom(candidate, roomWorldRing(room))) {
        verdict.reasons.push_back(ViolationKind::OutsideRoom);
    }
    if (overlapsAny(candidate, others, excludeId)) {
        verdict.reasons.push_back(ViolationKind::FurnitureOverlap);
    }
    if (intrudesDoorSwing(candidate, room)) {
        verdict.reasons.push_back(ViolationKind::DoorSwing);
    }

    verdict.isValid = verdict.reasons.empty();
    return verdict;
}

} // namespace floorplan
