#include "floorplan/layout/layout_queries.h"
#include "floorplan/core/engine_config.h"
#include "floorplan/core/logging.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/placement/placement_validator.h"
#include "floorplan/shape/shape_resolution.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace floorplan {

PlacedItem worldPlacement(const FurnitureRec& furniture, const RoomRec& room) {
    PlacedItem item;
    item.id = furniture.id;
    item.shape = furniture.shape;
    item.shape.position = {
        room.position.x + furniture.shape.position.x,
        room.position.y + furniture.shape.position.y,
    };
    return item;
}

std::vector<PlacedItem> worldItems(const LayoutSnapshot& layout, std::uint32_t excludeId) {
    std::vector<PlacedItem> out;
    out.reserve(layout.furniture.size());
    for (const FurnitureRec& f : layout.furniture) {
        if (excludeId != kNoId && f.id == excludeId) continue;
        const RoomRec* room = findRoom(layout.rooms, f.roomId);
        if (!room) continue;
        out.push_back(worldPlacement(f, *room));
    }
    return out;
}

bool checkRoomCollision(const std::vector<RoomRec>& rooms, std::uint32_t roomId, const Point2& position) {
    const RoomRec* room = findRoom(rooms, roomId);
    if (!room) return false;

    const Ring moving = translateRing(room->vertices, position);
    for (const RoomRec& other : rooms) {
        if (other.id == roomId) continue;
        if (polygonInteriorsOverlap(moving, roomWorldRing(other))) {
            FLOORPLAN_LOG_DEBUG("room %u overlaps room %u", roomId, other.id);
            return true;
        }
    }
    return false;
}

PlacementVerdict validateRoomPlacement(const std::vector<RoomRec>& rooms, std::uint32_t roomId, const Point2& position) {
    PlacementVerdict verdict;
    if (checkRoomCollision(rooms, roomId, position)) {
        verdict.reasons.push_back(ViolationKind::RoomOverlap);
    }
    verdict.isValid = verdict.reasons.empty();
    return verdict;
}

bool checkFurnitureCollision(
    const LayoutSnapshot& layout,
    std::uint32_t furnitureId,
    const Point2& position,
    std::uint32_t roomId) {
    const FurnitureRec* f = findFurniture(layout.furniture, furnitureId);
    const RoomRec* room = findRoom(layout.rooms, roomId);
    if (!f || !room) return true;

    FurnitureRec moved = *f;
    moved.shape.position = position;
    const PlacedItem candidate = worldPlacement(moved, *room);
    return !isValidPlacement(candidate.shape, *room, worldItems(layout), furnitureId).isValid;
}

bool canRotate(
    const PlacedShape& placed,
    Rotation rotation,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    std::uint32_t excludeId) {
    PlacedShape rotated = placed;
    rotated.rotation = rotation;
    return isValidPlacement(rotated, room, others, excludeId).isValid;
}

std::vector<Rotation> validRotations(
    const PlacedShape& placed,
    const RoomRec& room,
    const std::vector<PlacedItem>& others,
    std::uint32_t excludeId) {
    static constexpr Rotation kAll[] = { Rotation::Deg0, Rotation::Deg90, Rotation::Deg180, Rotation::Deg270 };
    std::vector<Rotation> out;
    for (const Rotation r : kAll) {
        if (canRotate(placed, r, room, others, excludeId)) out.push_back(r);
    }
    return out;
}

std::uint32_t hitTestRoom(const Point2& point, const std::vector<RoomRec>& rooms) {
    for (auto it = rooms.rbegin(); it != rooms.rend(); ++it) {
        if (pointInPolygon(point, roomWorldRing(*it))) return it->id;
    }
    return kNoId;
}

std::uint32_t hitTestFurniture(const Point2& point, const LayoutSnapshot& layout) {
    for (auto it = layout.furniture.rbegin(); it != layout.furniture.rend(); ++it) {
        const RoomRec* room = findRoom(layout.rooms, it->roomId);
        if (!room) continue;

        const PlacedItem item = worldPlacement(*it, *room);
        if (item.shape.shape.kind == ShapeKind::Circle) {
            if (pointInCircle(point, placedCenter(item.shape), item.shape.shape.radius)) return it->id;
            continue;
        }
        if (pointInPolygon(point, resolveRing(item.shape.shape, item.shape.rotation, item.shape.position))) {
            return it->id;
        }
    }
    return kNoId;
}

Ring outlineRing(const PlacedShape& placed) {
    if (placed.shape.kind == ShapeKind::Circle) {
        return circleRing(placedCenter(placed), placed.shape.radius);
    }
    return resolveRing(placed.shape, placed.rotation, placed.position);
}

float furnitureWallClearance(const PlacedShape& placed, const Ring& roomRing) {
    const Ring vertices = outlineRing(placed);
    const std::size_t n = roomRing.size();
    float minDistance = std::numeric_limits<float>::infinity();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = roomRing[i];
        const Point2& b = roomRing[(i + 1) % n];
        for (const Point2& v : vertices) {
            minDistance = std::min(minDistance, distancePointToSegment(v, a, b));
        }
    }
    return std::isinf(minDistance) ? 0.0f : minDistance;
}

namespace {

void collectGaps(
    const Ring& furnitureRing,
    const Ring& obstacle,
    ObstacleKind kind,
    const std::string& name,
    std::vector<DistanceMeasurement>& out) {
    const std::size_t fn = furnitureRing.size();
    const std::size_t on = obstacle.size();
    if (fn < 2 || on < 2) return;

    for (std::size_t i = 0; i < fn; ++i) {
        const Point2& fs = furnitureRing[i];
        const Point2& fe = furnitureRing[(i + 1) % fn];
        for (std::size_t j = 0; j < on; ++j) {
            const SegmentDistance d = segmentToSegmentDistance(fs, fe, obstacle[j], obstacle[(j + 1) % on]);
            out.push_back({ d.distance, d.pointOnA, d.pointOnB, kind, name });
        }
    }
}

bool sameDirection(const DistanceMeasurement& a, const DistanceMeasurement& b) {
    const float ax = a.furniturePoint.x - a.obstaclePoint.x;
    const float ay = a.furniturePoint.y - a.obstaclePoint.y;
    const float bx = b.furniturePoint.x - b.obstaclePoint.x;
    const float by = b.furniturePoint.y - b.obstaclePoint.y;
    return std::fabs(ax - bx) < 1.0f && std::fabs(ay - by) < 1.0f;
}

} // namespace

std::vector<DistanceMeasurement> findNearestDistances(
    const Ring& furnitureRing,
    const Ring& roomRing,
    const std::vector<NamedRing>& others,
    std::size_t count) {
    std::vector<DistanceMeasurement> all;
    collectGaps(furnitureRing, roomRing, ObstacleKind::Wall, "Wall", all);
    for (const NamedRing& other : others) {
        collectGaps(furnitureRing, other.vertices, ObstacleKind::Furniture, other.name, all);
    }

    std::stable_sort(all.begin(), all.end(), [](const DistanceMeasurement& a, const DistanceMeasurement& b) {
        return a.distance < b.distance;
    });

    std::vector<DistanceMeasurement> selected;
    for (const DistanceMeasurement& m : all) {
        if (selected.size() >= count) break;
        if (m.distance < placement_constants::MIN_REPORTED_DISTANCE) continue;
        bool duplicate = false;
        for (const DistanceMeasurement& s : selected) {
            if (sameDirection(s, m)) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) selected.push_back(m);
    }
    return selected;
}

} // namespace floorplan
