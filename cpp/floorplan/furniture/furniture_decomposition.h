#pragma once

#include "floorplan/core/types.h"
#include "floorplan/shape/shape_template.h"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace floorplan {

// Axis-aligned box after rotation. 90/270° swap width and height.
Rect boundingBox(const PlacedShape& placed) noexcept;

// Horizontal leg (full width) then vertical leg (full height) of an L,
// rotated with the item. nullopt for every other kind and for cuts that
// leave no notch.
std::optional<std::array<Rect, 2>> lShapeRectangles(const PlacedShape& placed) noexcept;

enum class CollisionPartKind : std::uint8_t {
    Rect = 0,
    Circle = 1,
    Polygon = 2,
};

struct CollisionPart {
    CollisionPartKind kind{CollisionPartKind::Rect};
    Rect rect{0.0f, 0.0f, 0.0f, 0.0f}; // Rect parts; bounding rect otherwise
    Point2 center{0.0f, 0.0f};
    float radius{0.0f};
    Ring ring;                          // Polygon parts
};

// Two rects for an L, one circle, one polygon for beveled outlines, else one rect.
std::vector<CollisionPart> collisionParts(const PlacedShape& placed);

// Shared edges between rects are not overlap; polygon pairs use polygonsIntersect.
bool partsOverlap(const CollisionPart& a, const CollisionPart& b);

// Points the boundary and door checks sample for a part.
Ring partCorners(const CollisionPart& part);

Ring rectRing(const Rect& r);

} // namespace floorplan
