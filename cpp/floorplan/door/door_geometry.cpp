#include "floorplan/door/door_geometry.h"
#include "floorplan/core/engine_config.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/util.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/walls/wall_segments.h"

#include <cmath>

namespace floorplan {

std::optional<DoorGeometry> doorGeometry(
    const Point2& v1,
    const Point2& v2,
    float position,
    DoorAnchor anchor,
    float width,
    HingeSide hingeSide,
    OpenDirection openDirection) noexcept {
    const float dx = v2.x - v1.x;
    const float dy = v2.y - v1.y;
    const float len = std::sqrt(dx * dx + dy * dy);
    if (len <= 0.0f || !(width > 0.0f)) return std::nullopt;

    const float ux = dx / len;
    const float uy = dy / len;

    DoorGeometry g{};
    switch (anchor) {
        case DoorAnchor::FractionCenter:
            g.doorCenter = { v1.x + dx * position, v1.y + dy * position };
            break;
        case DoorAnchor::OffsetCenter:
            g.doorCenter = { v1.x + ux * position, v1.y + uy * position };
            break;
        case DoorAnchor::OffsetStart: {
            const float c = position + width * 0.5f;
            g.doorCenter = { v1.x + ux * c, v1.y + uy * c };
            break;
        }
    }

    g.segmentAngle = std::atan2(dy, dx);
    const float half = width * 0.5f;
    const float cosA = std::cos(g.segmentAngle);
    const float sinA = std::sin(g.segmentAngle);
    g.doorStart = { g.doorCenter.x - cosA * half, g.doorCenter.y - sinA * half };
    g.doorEnd = { g.doorCenter.x + cosA * half, g.doorCenter.y + sinA * half };

    if (hingeSide == HingeSide::Left) {
        g.hingePoint = g.doorStart;
        g.openEnd = g.doorEnd;
    } else {
        g.hingePoint = g.doorEnd;
        g.openEnd = g.doorStart;
    }

    float swingAngle = g.segmentAngle + kPi * 0.5f;
    if (openDirection == OpenDirection::Inward) swingAngle += kPi;

    g.swingEndPoint = {
        g.hingePoint.x + width * std::cos(swingAngle),
        g.hingePoint.y + width * std::sin(swingAngle),
    };
    g.swingStartPoint = g.openEnd;
    g.swingRadius = width;

    const float ox = g.openEnd.x - g.hingePoint.x;
    const float oy = g.openEnd.y - g.hingePoint.y;
    const float sx = g.swingEndPoint.x - g.hingePoint.x;
    const float sy = g.swingEndPoint.y - g.hingePoint.y;
    g.sweepFlag = (ox * sy - oy * sx) > 0.0f ? 1 : 0;
    return g;
}

std::optional<DoorGeometry> doorGeometryForRoom(const DoorRec& door, const RoomRec& room) {
    const std::vector<WallSegment> walls = wallSegments(room.vertices, room.position);
    if (door.wallIndex >= walls.size()) {
        FLOORPLAN_LOG_DEBUG("door %u references wall %u, room %u has %zu walls",
            door.id, door.wallIndex, room.id, walls.size());
        return std::nullopt;
    }
    const WallSegment& wall = walls[door.wallIndex];

    // Counter-clockwise rings keep the interior on the +90° side.
    OpenDirection direction = door.openDirection;
    if (signedArea(room.vertices) > 0.0f) {
        direction = direction == OpenDirection::Inward ? OpenDirection::Outward : OpenDirection::Inward;
    }
    return doorGeometry(wall.start, wall.end, door.position, door.anchor, door.width, door.hingeSide, direction);
}

bool pointInDoorSwing(const Point2& p, const DoorGeometry& geometry) noexcept {
    const Point2& h = geometry.hingePoint;
    const float dx = p.x - h.x;
    const float dy = p.y - h.y;
    const float d2 = dx * dx + dy * dy;
    if (d2 > geometry.swingRadius * geometry.swingRadius) return false;
    if (d2 <= placement_constants::BOUNDARY_EPSILON * placement_constants::BOUNDARY_EPSILON) return true;

    const float openAngle = normalizeAngle(std::atan2(geometry.openEnd.y - h.y, geometry.openEnd.x - h.x));
    const float swingAngle = normalizeAngle(std::atan2(geometry.swingEndPoint.y - h.y, geometry.swingEndPoint.x - h.x));

    // The sweep flag names the direction of the quarter arc from openEnd.
    const float start = geometry.sweepFlag ? openAngle : swingAngle;
    const float end = geometry.sweepFlag ? swingAngle : openAngle;

    const float a = normalizeAngle(std::atan2(dy, dx));
    const float eps = placement_constants::ARC_ANGLE_EPSILON;
    if (start <= end) {
        return a >= start - eps && a <= end + eps;
    }
    // Arc wraps through 0.
    return a >= start - eps || a <= end + eps;
}

OpenDirection interiorOpenDirection(const Point2& wallStart, const Point2& wallEnd, const Ring& ring) noexcept {
    const float dx = wallEnd.x - wallStart.x;
    const float dy = wallEnd.y - wallStart.y;
    const float len = std::sqrt(dx * dx + dy * dy);
    if (len <= 0.0f) return OpenDirection::Inward;

    const float probe = placement_constants::INTERIOR_SIDE_PROBE;
    const Point2 mid{ (wallStart.x + wallEnd.x) * 0.5f, (wallStart.y + wallEnd.y) * 0.5f };
    // +90° of (dx, dy) is (-dy, dx).
    const Point2 test{ mid.x - dy / len * probe, mid.y + dx / len * probe };
    return pointInPolygon(test, ring) ? OpenDirection::Outward : OpenDirection::Inward;
}

} // namespace floorplan
