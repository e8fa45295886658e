#include "floorplan/shape/shape_resolution.h"
#include "floorplan/core/engine_config.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/util.h"
#include "floorplan/geometry/primitives.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

namespace {

float clampFeature(float value, float extent, const char* what) {
    const float maxValue = std::max(0.0f, extent - placement_constants::MINIMUM_EXTENT);
    if (value < 0.0f) {
        FLOORPLAN_LOG_WARN("%s %.3f is negative, clamped to 0", what, static_cast<double>(value));
        return 0.0f;
    }
    if (value > maxValue) {
        FLOORPLAN_LOG_WARN("%s %.3f exceeds extent %.3f, clamped to %.3f",
            what, static_cast<double>(value), static_cast<double>(extent), static_cast<double>(maxValue));
        return maxValue;
    }
    return value;
}

// Rings below are listed in engine winding (interior on the right of each
// edge with y pointing down), relative to the footprint's top-left corner.

Ring rectangleRing(float w, float h) {
    return { { 0.0f, 0.0f }, { 0.0f, h }, { w, h }, { w, 0.0f } };
}

Ring lShapedRing(float w, float h, float cw, float ch, Corner corner) {
    switch (corner) {
        case Corner::TopLeft:
            return { { cw, 0.0f }, { cw, ch }, { 0.0f, ch }, { 0.0f, h }, { w, h }, { w, 0.0f } };
        case Corner::TopRight:
            return { { 0.0f, 0.0f }, { 0.0f, h }, { w, h }, { w, ch }, { w - cw, ch }, { w - cw, 0.0f } };
        case Corner::BottomLeft:
            return { { 0.0f, 0.0f }, { 0.0f, h - ch }, { cw, h - ch }, { cw, h }, { w, h }, { w, 0.0f } };
        case Corner::BottomRight:
            return { { 0.0f, 0.0f }, { 0.0f, h }, { w - cw, h }, { w - cw, h - ch }, { w, h - ch }, { w, 0.0f } };
    }
    return rectangleRing(w, h);
}

Ring beveledRing(float w, float h, float b, Corner corner) {
    switch (corner) {
        case Corner::TopLeft:
            return { { b, 0.0f }, { 0.0f, b }, { 0.0f, h }, { w, h }, { w, 0.0f } };
        case Corner::TopRight:
            return { { 0.0f, 0.0f }, { 0.0f, h }, { w, h }, { w, b }, { w - b, 0.0f } };
        case Corner::BottomLeft:
            return { { 0.0f, 0.0f }, { 0.0f, h - b }, { b, h }, { w, h }, { w, 0.0f } };
        case Corner::BottomRight:
            return { { 0.0f, 0.0f }, { 0.0f, h }, { w - b, h }, { w, h - b }, { w, 0.0f } };
    }
    return rectangleRing(w, h);
}

Ring localRing(const ShapeTemplate& shape) {
    const float w = shape.width;
    const float h = shape.height;
    switch (shape.kind) {
        case ShapeKind::Rectangle:
            return rectangleRing(w, h);
        case ShapeKind::LShaped: {
            const float cw = clampFeature(shape.cutWidth, w, "L cut width");
            const float ch = clampFeature(shape.cutHeight, h, "L cut height");
            if (cw <= 0.0f || ch <= 0.0f) return rectangleRing(w, h);
            return lShapedRing(w, h, cw, ch, shape.cutCorner);
        }
        case ShapeKind::Beveled: {
            const float b = clampFeature(shape.bevelSize, std::min(w, h), "bevel size");
            if (b <= 0.0f) return rectangleRing(w, h);
            return beveledRing(w, h, b, shape.bevelCorner);
        }
        case ShapeKind::Circle:
            break;
    }
    return {};
}

} // namespace

Point2 templateExtent(const ShapeTemplate& shape) noexcept {
    if (shape.kind == ShapeKind::Circle) {
        const float d = shape.radius * 2.0f;
        return { d, d };
    }
    return { shape.width, shape.height };
}

ResolvedShape resolveShape(const ShapeTemplate& shape, Rotation rotation, const Point2& origin) {
    ResolvedShape out;
    out.kind = shape.kind;

    const Point2 extent = templateExtent(shape);
    out.center = { origin.x + extent.x * 0.5f, origin.y + extent.y * 0.5f };

    if (shape.kind == ShapeKind::Circle) {
        out.radius = std::max(0.0f, shape.radius);
        return out;
    }

    if (extent.x <= 0.0f || extent.y <= 0.0f) {
        FLOORPLAN_LOG_WARN("degenerate shape %.3f x %.3f resolves to an empty ring",
            static_cast<double>(extent.x), static_cast<double>(extent.y));
        return out;
    }

    out.ring = rotateRing(translateRing(localRing(shape), origin), out.center, rotation);
    return out;
}

ResolvedShape resolvePlaced(const PlacedShape& placed) {
    return resolveShape(placed.shape, placed.rotation, placed.position);
}

Ring resolveRing(const ShapeTemplate& shape, Rotation rotation, const Point2& origin) {
    return resolveShape(shape, rotation, origin).ring;
}

Ring circleRing(const Point2& center, float radius, std::uint32_t segments) {
    Ring out;
    if (segments < 3 || radius <= 0.0f) return out;
    out.reserve(segments);
    // Clockwise on screen, matching the engine winding.
    for (std::uint32_t i = 0; i < segments; ++i) {
        const float a = -kTwoPi * static_cast<float>(i) / static_cast<float>(segments);
        out.push_back({ center.x + radius * std::cos(a), center.y + radius * std::sin(a) });
    }
    return out;
}

Point2 placedCenter(const PlacedShape& placed) noexcept {
    const Point2 extent = templateExtent(placed.shape);
    return { placed.position.x + extent.x * 0.5f, placed.position.y + extent.y * 0.5f };
}

PlacedShape placedAtCenter(const ShapeTemplate& shape, const Point2& center, Rotation rotation) noexcept {
    const Point2 extent = templateExtent(shape);
    PlacedShape p;
    p.shape = shape;
    p.position = { center.x - extent.x * 0.5f, center.y - extent.y * 0.5f };
    p.rotation = rotation;
    return p;
}

} // namespace floorplan
