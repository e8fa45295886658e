#pragma once

/**
 * @file engine_config.h
 * @brief Tunables and fixed tolerances for the placement engine.
 *
 * Units are inches throughout. Pixel-to-world scaling belongs to the rendering
 * layer; thresholds documented "in UI units" are world units as seen at the
 * editor's default zoom.
 */

namespace floorplan {

namespace placement_constants {

// =============================================================================
// Geometry Tolerances
// =============================================================================

/// Wall classification: |dy| below this is horizontal, |dx| below this is vertical
constexpr float AXIS_EPSILON = 0.1f;

/// Distance under which a point counts as lying on a ring boundary
constexpr float BOUNDARY_EPSILON = 1e-3f;

/// Angular slack for door-swing arc membership (radians)
constexpr float ARC_ANGLE_EPSILON = 1e-4f;

/// Smallest feature a clamped cut or bevel may leave behind (1/8")
constexpr float MINIMUM_EXTENT = 0.125f;

/// Inset used for interior probe points in room overlap tests
constexpr float INTERIOR_PROBE_OFFSET = 0.01f;

/// Distance along a wall normal used to decide which side is the room interior
constexpr float INTERIOR_SIDE_PROBE = 10.0f;

// =============================================================================
// Snapping
// =============================================================================

/// Wall-point snap threshold for door placement
constexpr float WALL_SNAP_DISTANCE = 20.0f;

/// Default room-to-room snap threshold
constexpr float ROOM_SNAP_DISTANCE = 12.0f;

/// Half-inch grid used by furniture placement
constexpr float HALF_UNIT_GRID = 0.5f;

// =============================================================================
// Nearest-Valid-Position Search
// =============================================================================

constexpr float SEARCH_RADIUS = 12.0f;
constexpr float SEARCH_STEP = 0.5f;
constexpr int SEARCH_MIN_SAMPLES = 8;

/// Upper bound on maxRadius / step; larger searches are rejected
constexpr int SEARCH_MAX_RINGS = 4096;

// =============================================================================
// Measurement
// =============================================================================

/// Display rounding increment (eighths of an inch)
constexpr float MEASUREMENT_INCREMENT = 0.125f;

/// Gaps smaller than this are not reported as distance measurements
constexpr float MIN_REPORTED_DISTANCE = 1.0f;

} // namespace placement_constants

struct EngineConfig {
    float gridSize = placement_constants::HALF_UNIT_GRID;
    float roomSnapThreshold = placement_constants::ROOM_SNAP_DISTANCE;
    float wallSnapThreshold = placement_constants::WALL_SNAP_DISTANCE;
    float searchRadius = placement_constants::SEARCH_RADIUS;
    float searchStep = placement_constants::SEARCH_STEP;
    float measurementIncrement = placement_constants::MEASUREMENT_INCREMENT;
};

inline bool isGridSnapEnabled(const EngineConfig& config) {
    return config.gridSize > 0.0001f;
}

} // namespace floorplan
