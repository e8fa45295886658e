#include "floorplan/walls/wall_segments.h"
#include "floorplan/core/util.h"

#include <cmath>

namespace floorplan {

WallOrientation classifyWall(const Point2& a, const Point2& b) noexcept {
    const float dx = std::fabs(b.x - a.x);
    const float dy = std::fabs(b.y - a.y);
    if (dy < placement_constants::AXIS_EPSILON) return WallOrientation::Horizontal;
    if (dx < placement_constants::AXIS_EPSILON) return WallOrientation::Vertical;
    return WallOrientation::Diagonal;
}

std::vector<WallSegment> wallSegments(const Ring& ring, const Point2& worldOffset, float measurementIncrement) {
    std::vector<WallSegment> walls;
    const std::size_t n = ring.size();
    if (n < 2) return walls;

    walls.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = ring[i];
        const Point2& b = ring[(i + 1) % n];

        WallSegment w{};
        w.start = { a.x + worldOffset.x, a.y + worldOffset.y };
        w.end = { b.x + worldOffset.x, b.y + worldOffset.y };
        const float dx = b.x - a.x;
        const float dy = b.y - a.y;
        w.exactLength = std::sqrt(dx * dx + dy * dy);
        w.length = roundToIncrement(w.exactLength, measurementIncrement);
        w.orientation = classifyWall(a, b);
        w.index = static_cast<std::uint32_t>(i);
        walls.push_back(w);
    }
    return walls;
}

} // namespace floorplan
