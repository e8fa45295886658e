#pragma once

#include "floorplan/core/types.h"

#include <cstdint>

namespace floorplan {

enum class ShapeKind : std::uint8_t {
    Rectangle = 1,
    Circle = 2,
    LShaped = 3,
    Beveled = 4, // rooms only
};

// Declarative outline owned by a room or furniture item. Fields not used by
// `kind` stay zero; build instances through the named factories.
struct ShapeTemplate {
    ShapeKind kind{ShapeKind::Rectangle};
    float width{0.0f};
    float height{0.0f};
    float radius{0.0f};
    float cutWidth{0.0f};
    float cutHeight{0.0f};
    Corner cutCorner{Corner::TopRight};
    float bevelSize{0.0f};
    Corner bevelCorner{Corner::TopLeft};

    static ShapeTemplate rectangle(float width, float height) {
        ShapeTemplate t;
        t.kind = ShapeKind::Rectangle;
        t.width = width;
        t.height = height;
        return t;
    }

    static ShapeTemplate circle(float radius) {
        ShapeTemplate t;
        t.kind = ShapeKind::Circle;
        t.radius = radius;
        return t;
    }

    static ShapeTemplate lShaped(float width, float height, float cutWidth, float cutHeight, Corner cutCorner) {
        ShapeTemplate t;
        t.kind = ShapeKind::LShaped;
        t.width = width;
        t.height = height;
        t.cutWidth = cutWidth;
        t.cutHeight = cutHeight;
        t.cutCorner = cutCorner;
        return t;
    }

    // L desks and sectionals: `length` along x, `width` along y, legs `depth`
    // thick running along the bottom and right sides at rotation 0.
    static ShapeTemplate lShapedFromDepth(float length, float width, float depth) {
        return lShaped(length, width, length - depth, width - depth, Corner::TopLeft);
    }

    static ShapeTemplate beveled(float width, float height, float bevelSize, Corner bevelCorner) {
        ShapeTemplate t;
        t.kind = ShapeKind::Beveled;
        t.width = width;
        t.height = height;
        t.bevelSize = bevelSize;
        t.bevelCorner = bevelCorner;
        return t;
    }
};

// A template positioned in its parent frame. `position` is the top-left of the
// unrotated footprint; rotation turns the footprint about its own center.
struct PlacedShape {
    ShapeTemplate shape;
    Point2 position{0.0f, 0.0f};
    Rotation rotation{Rotation::Deg0};
};

} // namespace floorplan
