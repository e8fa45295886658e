#pragma once

#include "floorplan/core/types.h"
#include "floorplan/shape/shape_template.h"

#include <cstdint>

namespace floorplan {

struct ResolvedShape {
    ShapeKind kind{ShapeKind::Rectangle};
    Ring ring;            // empty for circles
    Point2 center{0.0f, 0.0f};
    float radius{0.0f};   // circles only
};

// Unrotated footprint size (2r x 2r for circles).
Point2 templateExtent(const ShapeTemplate& shape) noexcept;

// Ring (engine winding) or circle for a template placed at `origin` and turned
// by `rotation` about its footprint center. Invalid cuts and bevels are clamped.
ResolvedShape resolveShape(const ShapeTemplate& shape, Rotation rotation, const Point2& origin);

ResolvedShape resolvePlaced(const PlacedShape& placed);

// Convenience: ring only (empty for circles and degenerate templates).
Ring resolveRing(const ShapeTemplate& shape, Rotation rotation, const Point2& origin);

// Polygonal approximation of a circle, for callers that need a ring.
Ring circleRing(const Point2& center, float radius, std::uint32_t segments = 32);

// Footprint center of a placed shape; invariant under rotation.
Point2 placedCenter(const PlacedShape& placed) noexcept;

PlacedShape placedAtCenter(const ShapeTemplate& shape, const Point2& center, Rotation rotation = Rotation::Deg0) noexcept;

} // namespace floorplan
