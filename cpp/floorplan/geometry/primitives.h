#pragma once

#include "floorplan/core/types.h"

#include <cstdint>
#include <vector>

namespace floorplan {

// =============================================================================
// Point / Polygon Predicates
// =============================================================================

// Ray casting with the half-open crossing rule. Points exactly on an edge get a
// stable (but side-dependent) answer. Rings with fewer than 3 points contain nothing.
bool pointInPolygon(const Point2& p, const Ring& ring) noexcept;

bool pointOnPolygonBoundary(const Point2& p, const Ring& ring, float eps) noexcept;

// Inside, or within eps of the boundary.
bool pointInOrOnPolygon(const Point2& p, const Ring& ring, float eps) noexcept;

// Touching endpoints and collinear overlap both count as intersecting.
bool segmentsIntersect(const Point2& p1, const Point2& q1, const Point2& p2, const Point2& q2) noexcept;

// Strict crossing: each segment has its endpoints on opposite sides of the other.
bool segmentsCrossProperly(const Point2& p1, const Point2& q1, const Point2& p2, const Point2& q2) noexcept;

// Vertex containment both ways plus every edge pair. Symmetric in its arguments.
bool polygonsIntersect(const Ring& a, const Ring& b) noexcept;

// True only when the interiors share area; shared edges or corners do not count.
bool polygonInteriorsOverlap(const Ring& a, const Ring& b);

// =============================================================================
// Distances
// =============================================================================

float distancePointToSegment(const Point2& p, const Point2& a, const Point2& b) noexcept;

Point2 closestPointOnSegment(const Point2& p, const Point2& a, const Point2& b) noexcept;

struct SegmentDistance {
    float distance;
    Point2 pointOnA;
    Point2 pointOnB;
};

// Minimum over the four endpoint-to-segment projections.
SegmentDistance segmentToSegmentDistance(const Point2& a1, const Point2& a2, const Point2& b1, const Point2& b2) noexcept;

// =============================================================================
// Area / Winding
// =============================================================================

// Shoelace sum / 2. Negative for engine winding (interior on the right of each edge).
float signedArea(const Ring& ring) noexcept;

// Absolute shoelace area. Display only.
float polygonArea(const Ring& ring) noexcept;

// =============================================================================
// Circles
// =============================================================================

bool pointInCircle(const Point2& p, const Point2& center, float radius) noexcept;
bool circlesIntersect(const Point2& c1, float r1, const Point2& c2, float r2) noexcept;
bool circlePolygonIntersect(const Point2& center, float radius, const Ring& ring) noexcept;

// =============================================================================
// Ring Transforms
// =============================================================================

Aabb ringBounds(const Ring& ring) noexcept;

Ring translateRing(const Ring& ring, const Point2& offset);

// Exact quarter-turn rotation about center (positive turns rotate +x toward +y).
Point2 rotatePointQuarterTurns(const Point2& p, const Point2& center, int turns) noexcept;

Ring rotateRing(const Ring& ring, const Point2& center, Rotation rotation);

Rect rotateRectQuarterTurns(const Rect& r, const Point2& center, int turns) noexcept;

} // namespace floorplan
