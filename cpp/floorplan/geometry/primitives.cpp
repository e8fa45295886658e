#include "floorplan/geometry/primitives.h"
#include "floorplan/core/engine_config.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace floorplan {

// Math helpers
static float distSq(const Point2& a, const Point2& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    return dx * dx + dy * dy;
}

// 0 = collinear, 1 = clockwise, 2 = counter-clockwise
static int orientation(const Point2& p, const Point2& q, const Point2& r) {
    const float val = (q.y - p.y) * (r.x - q.x) - (q.x - p.x) * (r.y - q.y);
    if (val == 0.0f) return 0;
    return val > 0.0f ? 1 : 2;
}

// q lies within the bounding box of segment pr (caller guarantees collinearity).
static bool onSegment(const Point2& p, const Point2& q, const Point2& r) {
    return q.x <= std::max(p.x, r.x) && q.x >= std::min(p.x, r.x) &&
           q.y <= std::max(p.y, r.y) && q.y >= std::min(p.y, r.y);
}

bool pointInPolygon(const Point2& p, const Ring& ring) noexcept {
    const std::size_t n = ring.size();
    if (n < 3) return false;

    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const float xi = ring[i].x;
        const float yi = ring[i].y;
        const float xj = ring[j].x;
        const float yj = ring[j].y;

        if (((yi > p.y) != (yj > p.y)) &&
            (p.x < (xj - xi) * (p.y - yi) / (yj - yi) + xi)) {
            inside = !inside;
        }
    }
    return inside;
}

bool pointOnPolygonBoundary(const Point2& p, const Ring& ring, float eps) noexcept {
    const std::size_t n = ring.size();
    if (n < 2) return false;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = ring[i];
        const Point2& b = ring[(i + 1) % n];
        if (distancePointToSegment(p, a, b) <= eps) return true;
    }
    return false;
}

bool pointInOrOnPolygon(const Point2& p, const Ring& ring, float eps) noexcept {
    if (ring.size() < 3) return false;
    return pointOnPolygonBoundary(p, ring, eps) || pointInPolygon(p, ring);
}

bool segmentsIntersect(const Point2& p1, const Point2& q1, const Point2& p2, const Point2& q2) noexcept {
    const int o1 = orientation(p1, q1, p2);
    const int o2 = orientation(p1, q1, q2);
    const int o3 = orientation(p2, q2, p1);
    const int o4 = orientation(p2, q2, q1);

    if (o1 != o2 && o3 != o4) return true;

    if (o1 == 0 && onSegment(p1, p2, q1)) return true;
    if (o2 == 0 && onSegment(p1, q2, q1)) return true;
    if (o3 == 0 && onSegment(p2, p1, q2)) return true;
    if (o4 == 0 && onSegment(p2, q1, q2)) return true;

    return false;
}

bool segmentsCrossProperly(const Point2& p1, const Point2& q1, const Point2& p2, const Point2& q2) noexcept {
    const int o1 = orientation(p1, q1, p2);
    const int o2 = orientation(p1, q1, q2);
    const int o3 = orientation(p2, q2, p1);
    const int o4 = orientation(p2, q2, q1);
    if (o1 == 0 || o2 == 0 || o3 == 0 || o4 == 0) return false;
    return o1 != o2 && o3 != o4;
}

bool polygonsIntersect(const Ring& a, const Ring& b) noexcept {
    if (a.size() < 3 || b.size() < 3) return false;

    for (const Point2& v : a) {
        if (pointInPolygon(v, b)) return true;
    }
    for (const Point2& v : b) {
        if (pointInPolygon(v, a)) return true;
    }

    for (std::size_t i = 0; i < a.size(); ++i) {
        const Point2& p1 = a[i];
        const Point2& q1 = a[(i + 1) % a.size()];
        for (std::size_t j = 0; j < b.size(); ++j) {
            const Point2& p2 = b[j];
            const Point2& q2 = b[(j + 1) % b.size()];
            if (segmentsIntersect(p1, q1, p2, q2)) return true;
        }
    }
    return false;
}

namespace {

Point2 inwardNormal(const Point2& a, const Point2& b, float windingSign) {
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    const float len = std::sqrt(dx * dx + dy * dy);
    if (len <= 0.0f) return { 0.0f, 0.0f };
    // Positive signed area keeps the interior on the left of each edge.
    if (windingSign > 0.0f) return { -dy / len, dx / len };
    return { dy / len, -dx / len };
}

// Points just inside `ring` near each edge midpoint and each vertex.
void collectInteriorProbes(const Ring& ring, std::vector<Point2>& out) {
    const std::size_t n = ring.size();
    const float sign = signedArea(ring);
    const float off = placement_constants::INTERIOR_PROBE_OFFSET;

    for (std::size_t i = 0; i < n; ++i) {
        const Point2& prev = ring[(i + n - 1) % n];
        const Point2& a = ring[i];
        const Point2& b = ring[(i + 1) % n];

        const Point2 nEdge = inwardNormal(a, b, sign);
        const Point2 nPrev = inwardNormal(prev, a, sign);

        const Point2 mid{ (a.x + b.x) * 0.5f, (a.y + b.y) * 0.5f };
        const Point2 edgeProbe{ mid.x + nEdge.x * off, mid.y + nEdge.y * off };
        const Point2 cornerProbe{ a.x + (nEdge.x + nPrev.x) * off, a.y + (nEdge.y + nPrev.y) * off };

        if (pointInPolygon(edgeProbe, ring)) out.push_back(edgeProbe);
        if (pointInPolygon(cornerProbe, ring)) out.push_back(cornerProbe);
    }
}

bool anyProbeStrictlyInside(const std::vector<Point2>& probes, const Ring& ring) {
    for (const Point2& p : probes) {
        if (pointInPolygon(p, ring) && !pointOnPolygonBoundary(p, ring, placement_constants::BOUNDARY_EPSILON)) {
            return true;
        }
    }
    return false;
}

} // namespace

bool polygonInteriorsOverlap(const Ring& a, const Ring& b) {
    if (a.size() < 3 || b.size() < 3) return false;

    const Aabb ba = ringBounds(a);
    const Aabb bb = ringBounds(b);
    if (!ba.intersects(bb)) return false;

    for (std::size_t i = 0; i < a.size(); ++i) {
        const Point2& p1 = a[i];
        const Point2& q1 = a[(i + 1) % a.size()];
        for (std::size_t j = 0; j < b.size(); ++j) {
            if (segmentsCrossProperly(p1, q1, b[j], b[(j + 1) % b.size()])) return true;
        }
    }

    std::vector<Point2> probes;
    probes.reserve(a.size() * 2);
    collectInteriorProbes(a, probes);
    if (anyProbeStrictlyInside(probes, b)) return true;

    probes.clear();
    collectInteriorProbes(b, probes);
    return anyProbeStrictlyInside(probes, a);
}

float distancePointToSegment(const Point2& p, const Point2& a, const Point2& b) noexcept {
    const Point2 c = closestPointOnSegment(p, a, b);
    return std::sqrt(distSq(p, c));
}

Point2 closestPointOnSegment(const Point2& p, const Point2& a, const Point2& b) noexcept {
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    const float l2 = dx * dx + dy * dy;
    if (l2 == 0.0f) return a;

    float t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / l2;
    t = std::max(0.0f, std::min(1.0f, t));
    return { a.x + t * dx, a.y + t * dy };
}

SegmentDistance segmentToSegmentDistance(const Point2& a1, const Point2& a2, const Point2& b1, const Point2& b2) noexcept {
    const Point2 a1OnB = closestPointOnSegment(a1, b1, b2);
    const Point2 a2OnB = closestPointOnSegment(a2, b1, b2);
    const Point2 b1OnA = closestPointOnSegment(b1, a1, a2);
    const Point2 b2OnA = closestPointOnSegment(b2, a1, a2);

    const SegmentDistance candidates[4] = {
        { std::sqrt(distSq(a1, a1OnB)), a1, a1OnB },
        { std::sqrt(distSq(a2, a2OnB)), a2, a2OnB },
        { std::sqrt(distSq(b1, b1OnA)), b1OnA, b1 },
        { std::sqrt(distSq(b2, b2OnA)), b2OnA, b2 },
    };

    SegmentDistance best = candidates[0];
    for (int i = 1; i < 4; ++i) {
        if (candidates[i].distance < best.distance) best = candidates[i];
    }
    return best;
}

float signedArea(const Ring& ring) noexcept {
    const std::size_t n = ring.size();
    if (n < 3) return 0.0f;
    float sum = 0.0f;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& cur = ring[i];
        const Point2& next = ring[(i + 1) % n];
        sum += cur.x * next.y - next.x * cur.y;
    }
    return sum * 0.5f;
}

float polygonArea(const Ring& ring) noexcept {
    return std::fabs(signedArea(ring));
}

bool pointInCircle(const Point2& p, const Point2& center, float radius) noexcept {
    return distSq(p, center) <= radius * radius;
}

bool circlesIntersect(const Point2& c1, float r1, const Point2& c2, float r2) noexcept {
    return std::sqrt(distSq(c1, c2)) < r1 + r2;
}

bool circlePolygonIntersect(const Point2& center, float radius, const Ring& ring) noexcept {
    if (ring.size() < 3) return false;
    if (pointInPolygon(center, ring)) return true;

    for (std::size_t i = 0; i < ring.size(); ++i) {
        if (distancePointToSegment(center, ring[i], ring[(i + 1) % ring.size()]) < radius) return true;
    }
    return false;
}

Aabb ringBounds(const Ring& ring) noexcept {
    if (ring.empty()) return { 0.0f, 0.0f, 0.0f, 0.0f };
    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();

    for (const Point2& p : ring) {
        if (p.x < minX) minX = p.x;
        if (p.x > maxX) maxX = p.x;
        if (p.y < minY) minY = p.y;
        if (p.y > maxY) maxY = p.y;
    }
    return { minX, minY, maxX, maxY };
}

Ring translateRing(const Ring& ring, const Point2& offset) {
    Ring out;
    out.reserve(ring.size());
    for (const Point2& p : ring) {
        out.push_back({ p.x + offset.x, p.y + offset.y });
    }
    return out;
}

Point2 rotatePointQuarterTurns(const Point2& p, const Point2& center, int turns) noexcept {
    const float dx = p.x - center.x;
    const float dy = p.y - center.y;
    switch (((turns % 4) + 4) % 4) {
        case 1: return { center.x - dy, center.y + dx };
        case 2: return { center.x - dx, center.y - dy };
        case 3: return { center.x + dy, center.y - dx };
        default: return p;
    }
}

Ring rotateRing(const Ring& ring, const Point2& center, Rotation rotation) {
    const int turns = quarterTurns(rotation);
    if (turns == 0) return ring;

    Ring out;
    out.reserve(ring.size());
    for (const Point2& p : ring) {
        out.push_back(rotatePointQuarterTurns(p, center, turns));
    }
    return out;
}

Rect rotateRectQuarterTurns(const Rect& r, const Point2& center, int turns) noexcept {
    const Point2 a = rotatePointQuarterTurns({ r.x, r.y }, center, turns);
    const Point2 b = rotatePointQuarterTurns({ r.maxX(), r.maxY() }, center, turns);
    const float minX = std::min(a.x, b.x);
    const float minY = std::min(a.y, b.y);
    return { minX, minY, std::max(a.x, b.x) - minX, std::max(a.y, b.y) - minY };
}

} // namespace floorplan
