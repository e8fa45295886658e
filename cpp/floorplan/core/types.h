#ifndef FLOORPLAN_CORE_TYPES_H
#define FLOORPLAN_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Lightweight value types shared by the placement engine.
// All coordinates are inches, y grows downward (screen convention).

namespace floorplan {

static constexpr std::uint32_t kNoId = 0;

struct Point2 { float x; float y; };

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

// Axis-aligned box, (x, y) is the minimum corner.
struct Rect {
    float x;
    float y;
    float width;
    float height;

    float maxX() const { return x + width; }
    float maxY() const { return y + height; }
    Point2 center() const { return { x + width * 0.5f, y + height * 0.5f }; }
};

struct Aabb {
    float minX, minY, maxX, maxY;

    bool intersects(const Aabb& other) const {
        return (minX <= other.maxX && maxX >= other.minX &&
                minY <= other.maxY && maxY >= other.minY);
    }

    Rect toRect() const { return { minX, minY, maxX - minX, maxY - minY }; }
};

using Ring = std::vector<Point2>;

enum class Corner : std::uint8_t {
    TopLeft = 0,
    TopRight = 1,
    BottomLeft = 2,
    BottomRight = 3,
};

// Only right-angle rotations exist; this keeps every wall axis-aligned.
enum class Rotation : std::uint16_t {
    Deg0 = 0,
    Deg90 = 90,
    Deg180 = 180,
    Deg270 = 270,
};

inline int rotationDegrees(Rotation r) { return static_cast<int>(r); }

inline int quarterTurns(Rotation r) { return static_cast<int>(r) / 90; }

inline Rotation rotationFromQuarterTurns(int turns) {
    const int t = ((turns % 4) + 4) % 4;
    return static_cast<Rotation>(t * 90);
}

// Snaps an arbitrary angle to the nearest quarter turn.
inline Rotation rotationFromDegrees(int degrees) {
    const int normalized = ((degrees % 360) + 360) % 360;
    return rotationFromQuarterTurns((normalized + 45) / 90);
}

inline Rotation rotateClockwise(Rotation r) { return rotationFromQuarterTurns(quarterTurns(r) + 1); }
inline Rotation rotateCounterClockwise(Rotation r) { return rotationFromQuarterTurns(quarterTurns(r) - 1); }

enum class WallOrientation : std::uint8_t {
    Horizontal = 0,
    Vertical = 1,
    Diagonal = 2, // bevel chords only
};

struct WallSegment {
    Point2 start;
    Point2 end;
    float length;       // rounded to the measurement increment, display only
    float exactLength;  // unrounded, used by all math
    WallOrientation orientation;
    std::uint32_t index;
};

enum class HingeSide : std::uint8_t { Left = 0, Right = 1 };

enum class OpenDirection : std::uint8_t { Inward = 0, Outward = 1 };

// How DoorRec::position is interpreted.
enum class DoorAnchor : std::uint8_t {
    FractionCenter = 0, // 0..1 along the wall, door centered on it
    OffsetCenter = 1,   // inches from wall start to door center
    OffsetStart = 2,    // inches from wall start to the door's start edge
};

struct DoorRec {
    std::uint32_t id;
    std::uint32_t wallIndex;
    float position;
    DoorAnchor anchor;
    float width;
    HingeSide hingeSide;
    OpenDirection openDirection;
};

struct DoorGeometry {
    Point2 doorStart;
    Point2 doorEnd;
    Point2 doorCenter;
    Point2 hingePoint;
    Point2 openEnd;
    Point2 swingStartPoint;
    Point2 swingEndPoint;
    float swingRadius;
    std::uint8_t sweepFlag; // SVG arc sweep flag, 0 or 1
    float segmentAngle;     // radians
};

enum class ViolationKind : std::uint8_t {
    OutsideRoom = 1,
    FurnitureOverlap = 2,
    DoorSwing = 3,
    RoomOverlap = 4,
};

struct PlacementVerdict {
    bool isValid{true};
    std::vector<ViolationKind> reasons;

    bool has(ViolationKind kind) const {
        for (const ViolationKind k : reasons) {
            if (k == kind) return true;
        }
        return false;
    }
};

const char* violationMessage(ViolationKind kind);

} // namespace floorplan

#endif // FLOORPLAN_CORE_TYPES_H
