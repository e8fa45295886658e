#include "floorplan/snapping/snap_solver.h"
#include "floorplan/core/logging.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/walls/wall_segments.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace floorplan {

namespace {
    struct SnapAxisBest {
        bool snapped{false};
        float delta{0.0f};
        float dist{std::numeric_limits<float>::infinity()};
    };

    inline void considerAxis(float moving, float target, float tol, SnapAxisBest& best) {
        const float delta = target - moving;
        const float dist = std::abs(delta);
        if (dist <= tol && dist < best.dist) {
            best.dist = dist;
            best.delta = delta;
            best.snapped = true;
        }
    }
} // namespace

float snapToGrid(float value, float gridSize) noexcept {
    if (gridSize <= 0.0f) return value;
    return std::round(value / gridSize) * gridSize;
}

Point2 snapPointToGrid(const Point2& p, float gridSize) noexcept {
    return { snapToGrid(p.x, gridSize), snapToGrid(p.y, gridSize) };
}

std::optional<RoomSnapResult> findRoomSnapPosition(
    const Ring& movingRing,
    const Point2& position,
    const std::vector<RoomRec>& otherRooms,
    float threshold) {
    const std::vector<WallSegment> movingWalls = wallSegments(movingRing, position);
    if (movingWalls.empty()) return std::nullopt;

    SnapAxisBest bestX;
    SnapAxisBest bestY;

    for (const RoomRec& other : otherRooms) {
        const std::vector<WallSegment> otherWalls = wallSegments(other.vertices, other.position);
        for (const WallSegment& mw : movingWalls) {
            for (const WallSegment& ow : otherWalls) {
                if (mw.orientation != ow.orientation) continue;
                if (mw.orientation == WallOrientation::Vertical) {
                    considerAxis(mw.start.x, ow.start.x, threshold, bestX);
                } else if (mw.orientation == WallOrientation::Horizontal) {
                    considerAxis(mw.start.y, ow.start.y, threshold, bestY);
                }
            }
        }
    }

    if (!bestX.snapped && !bestY.snapped) return std::nullopt;

    RoomSnapResult out;
    out.snappedX = bestX.snapped;
    out.snappedY = bestY.snapped;
    out.dx = bestX.snapped ? bestX.delta : 0.0f;
    out.dy = bestY.snapped ? bestY.delta : 0.0f;
    out.position = { position.x + out.dx, position.y + out.dy };
    return out;
}

Point2 calculateSnappedRoomPosition(
    const std::vector<RoomRec>& rooms,
    std::uint32_t roomId,
    const Point2& rawPosition,
    float gridSize,
    float threshold) {
    const RoomRec* room = findRoom(rooms, roomId);
    if (!room) {
        FLOORPLAN_LOG_DEBUG("snap requested for unknown room %u", roomId);
        return rawPosition;
    }

    const Point2 gridded = snapPointToGrid(rawPosition, gridSize);

    std::vector<RoomRec> others;
    others.reserve(rooms.size());
    for (const RoomRec& r : rooms) {
        if (r.id != roomId) others.push_back(r);
    }

    if (const auto snap = findRoomSnapPosition(room->vertices, gridded, others, threshold)) {
        return snap->position;
    }
    return gridded;
}

std::optional<WallSnapResult> findClosestWallPoint(
    const Point2& worldPoint,
    const std::vector<WallSegment>& walls,
    float doorWidth,
    float maxDistance) {
    const WallSegment* best = nullptr;
    float bestDist = std::numeric_limits<float>::infinity();
    for (const WallSegment& w : walls) {
        if (w.exactLength <= 0.0f) continue;
        const float d = distancePointToSegment(worldPoint, w.start, w.end);
        if (d < bestDist) {
            bestDist = d;
            best = &w;
        }
    }
    if (!best || bestDist > maxDistance) return std::nullopt;

    const float len = best->exactLength;
    const float ux = (best->end.x - best->start.x) / len;
    const float uy = (best->end.y - best->start.y) / len;
    const Point2 onWall = closestPointOnSegment(worldPoint, best->start, best->end);
    const float along = (onWall.x - best->start.x) * ux + (onWall.y - best->start.y) * uy;

    const float halfDoor = doorWidth * 0.5f;
    const float maxStart = std::max(0.0f, len - doorWidth);

    WallSnapResult out;
    out.wallIndex = best->index;
    out.positionOnWall = std::max(0.0f, std::min(along - halfDoor, maxStart));
    out.centerOffset = out.positionOnWall + halfDoor;
    out.fraction = out.centerOffset / len;
    out.point = { best->start.x + ux * out.centerOffset, best->start.y + uy * out.centerOffset };
    out.wallAngle = std::atan2(best->end.y - best->start.y, best->end.x - best->start.x);
    out.distance = bestDist;
    return out;
}

} // namespace floorplan
