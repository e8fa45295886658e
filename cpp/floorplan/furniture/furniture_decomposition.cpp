#include "floorplan/furniture/furniture_decomposition.h"
#include "floorplan/core/engine_config.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/shape/shape_resolution.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

namespace {

bool rectsOverlapStrict(const Rect& a, const Rect& b) {
    return a.x < b.maxX() && a.maxX() > b.x &&
           a.y < b.maxY() && a.maxY() > b.y;
}

bool circleRectOverlap(const Point2& c, float r, const Rect& rect) {
    const float cx = std::max(rect.x, std::min(c.x, rect.maxX()));
    const float cy = std::max(rect.y, std::min(c.y, rect.maxY()));
    const float dx = c.x - cx;
    const float dy = c.y - cy;
    return std::sqrt(dx * dx + dy * dy) < r;
}

Ring partRing(const CollisionPart& part) {
    switch (part.kind) {
        case CollisionPartKind::Rect: return rectRing(part.rect);
        case CollisionPartKind::Circle: return circleRing(part.center, part.radius);
        case CollisionPartKind::Polygon: return part.ring;
    }
    return {};
}

} // namespace

Ring rectRing(const Rect& r) {
    return { { r.x, r.y }, { r.x, r.maxY() }, { r.maxX(), r.maxY() }, { r.maxX(), r.y } };
}

Rect boundingBox(const PlacedShape& placed) noexcept {
    const Point2 extent = templateExtent(placed.shape);
    const Rect footprint{ placed.position.x, placed.position.y, extent.x, extent.y };
    if (placed.shape.kind == ShapeKind::Circle) return footprint;
    return rotateRectQuarterTurns(footprint, footprint.center(), quarterTurns(placed.rotation));
}

std::optional<std::array<Rect, 2>> lShapeRectangles(const PlacedShape& placed) noexcept {
    const ShapeTemplate& s = placed.shape;
    if (s.kind != ShapeKind::LShaped) return std::nullopt;

    const float w = s.width;
    const float h = s.height;
    if (w <= 0.0f || h <= 0.0f) return std::nullopt;

    const float minExtent = placement_constants::MINIMUM_EXTENT;
    const float cw = std::max(0.0f, std::min(s.cutWidth, w - minExtent));
    const float ch = std::max(0.0f, std::min(s.cutHeight, h - minExtent));
    if (cw <= 0.0f || ch <= 0.0f) return std::nullopt;

    const bool cutOnTop = s.cutCorner == Corner::TopLeft || s.cutCorner == Corner::TopRight;
    const bool cutOnLeft = s.cutCorner == Corner::TopLeft || s.cutCorner == Corner::BottomLeft;

    const float ox = placed.position.x;
    const float oy = placed.position.y;
    const Rect horizontal{ ox, oy + (cutOnTop ? ch : 0.0f), w, h - ch };
    const Rect vertical{ ox + (cutOnLeft ? cw : 0.0f), oy, w - cw, h };

    const Point2 center{ ox + w * 0.5f, oy + h * 0.5f };
    const int turns = quarterTurns(placed.rotation);
    return std::array<Rect, 2>{
        rotateRectQuarterTurns(horizontal, center, turns),
        rotateRectQuarterTurns(vertical, center, turns),
    };
}

std::vector<CollisionPart> collisionParts(const PlacedShape& placed) {
    std::vector<CollisionPart> parts;
    const ShapeTemplate& s = placed.shape;

    if (s.kind == ShapeKind::Circle) {
        CollisionPart p;
        p.kind = CollisionPartKind::Circle;
        p.center = placedCenter(placed);
        p.radius = std::max(0.0f, s.radius);
        p.rect = boundingBox(placed);
        parts.push_back(p);
        return parts;
    }

    if (s.kind == ShapeKind::LShaped) {
        if (const auto legs = lShapeRectangles(placed)) {
            for (const Rect& r : *legs) {
                CollisionPart p;
                p.kind = CollisionPartKind::Rect;
                p.rect = r;
                p.center = r.center();
                parts.push_back(p);
            }
            return parts;
        }
    }

    if (s.kind == ShapeKind::Beveled) {
        CollisionPart p;
        p.kind = CollisionPartKind::Polygon;
        p.ring = resolveRing(s, placed.rotation, placed.position);
        p.rect = boundingBox(placed);
        p.center = p.rect.center();
        if (!p.ring.empty()) {
            parts.push_back(p);
            return parts;
        }
    }

    CollisionPart p;
    p.kind = CollisionPartKind::Rect;
    p.rect = boundingBox(placed);
    p.center = p.rect.center();
    parts.push_back(p);
    return parts;
}

bool partsOverlap(const CollisionPart& a, const CollisionPart& b) {
    using K = CollisionPartKind;
    if (a.kind == K::Rect && b.kind == K::Rect) return rectsOverlapStrict(a.rect, b.rect);
    if (a.kind == K::Circle && b.kind == K::Circle) return circlesIntersect(a.center, a.radius, b.center, b.radius);
    if (a.kind == K::Circle && b.kind == K::Rect) return circleRectOverlap(a.center, a.radius, b.rect);
    if (a.kind == K::Rect && b.kind == K::Circle) return circleRectOverlap(b.center, b.radius, a.rect);
    return polygonsIntersect(partRing(a), partRing(b));
}

Ring partCorners(const CollisionPart& part) {
    if (part.kind == CollisionPartKind::Polygon) return part.ring;
    return rectRing(part.rect);
}

} // namespace floorplan
