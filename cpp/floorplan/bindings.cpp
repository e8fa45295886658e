#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "floorplan/door/door_geometry.h"
#include "floorplan/interaction/placement_session.h"
#include "floorplan/layout/layout_queries.h"
#include "floorplan/measure/measurement_format.h"
#include "floorplan/placement/nearest_position.h"
#include "floorplan/placement/placement_validator.h"
#include "floorplan/shape/shape_resolution.h"
#include "floorplan/snapping/snap_solver.h"
#include "floorplan/walls/wall_segments.h"

#ifdef EMSCRIPTEN
using namespace floorplan;

// Flat results for JS; `valid` stands in for an empty optional.
struct DoorGeometryResult {
    DoorGeometry geometry;
    bool valid;
};

struct PositionResult {
    Point2 position;
    bool valid;
};

struct WallSnapBindingResult {
    WallSnapResult snap;
    bool valid;
};

struct MeasurementParseResult {
    int eighths;
    bool valid;
};

EMSCRIPTEN_BINDINGS(floorplan_module) {
    emscripten::enum_<ShapeKind>("ShapeKind")
        .value("Rectangle", ShapeKind::Rectangle)
        .value("Circle", ShapeKind::Circle)
        .value("LShaped", ShapeKind::LShaped)
        .value("Beveled", ShapeKind::Beveled);

    emscripten::enum_<Corner>("Corner")
        .value("TopLeft", Corner::TopLeft)
        .value("TopRight", Corner::TopRight)
        .value("BottomLeft", Corner::BottomLeft)
        .value("BottomRight", Corner::BottomRight);

    emscripten::enum_<Rotation>("Rotation")
        .value("Deg0", Rotation::Deg0)
        .value("Deg90", Rotation::Deg90)
        .value("Deg180", Rotation::Deg180)
        .value("Deg270", Rotation::Deg270);

    emscripten::enum_<HingeSide>("HingeSide")
        .value("Left", HingeSide::Left)
        .value("Right", HingeSide::Right);

    emscripten::enum_<OpenDirection>("OpenDirection")
        .value("Inward", OpenDirection::Inward)
        .value("Outward", OpenDirection::Outward);

    emscripten::enum_<DoorAnchor>("DoorAnchor")
        .value("FractionCenter", DoorAnchor::FractionCenter)
        .value("OffsetCenter", DoorAnchor::OffsetCenter)
        .value("OffsetStart", DoorAnchor::OffsetStart);

    emscripten::enum_<ViolationKind>("ViolationKind")
        .value("OutsideRoom", ViolationKind::OutsideRoom)
        .value("FurnitureOverlap", ViolationKind::FurnitureOverlap)
        .value("DoorSwing", ViolationKind::DoorSwing)
        .value("RoomOverlap", ViolationKind::RoomOverlap);

    emscripten::enum_<SessionMode>("SessionMode")
        .value("Idle", SessionMode::Idle)
        .value("Placing", SessionMode::Placing)
        .value("Moving", SessionMode::Moving);

    emscripten::enum_<SessionStatus>("SessionStatus")
        .value("Confirmed", SessionStatus::Confirmed)
        .value("Cancelled", SessionStatus::Cancelled);

    emscripten::register_vector<Point2>("VectorPoint2");
    emscripten::register_vector<DoorRec>("VectorDoorRec");
    emscripten::register_vector<PlacedItem>("VectorPlacedItem");
    emscripten::register_vector<RoomRec>("VectorRoomRec");
    emscripten::register_vector<ViolationKind>("VectorViolationKind");
    emscripten::register_vector<WallSegment>("VectorWallSegment");
    emscripten::register_vector<Rotation>("VectorRotation");

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<Rect>("Rect")
        .field("x", &Rect::x)
        .field("y", &Rect::y)
        .field("width", &Rect::width)
        .field("height", &Rect::height);

    emscripten::value_object<ShapeTemplate>("ShapeTemplate")
        .field("kind", &ShapeTemplate::kind)
        .field("width", &ShapeTemplate::width)
        .field("height", &ShapeTemplate::height)
        .field("radius", &ShapeTemplate::radius)
        .field("cutWidth", &ShapeTemplate::cutWidth)
        .field("cutHeight", &ShapeTemplate::cutHeight)
        .field("cutCorner", &ShapeTemplate::cutCorner)
        .field("bevelSize", &ShapeTemplate::bevelSize)
        .field("bevelCorner", &ShapeTemplate::bevelCorner);

    emscripten::value_object<PlacedShape>("PlacedShape")
        .field("shape", &PlacedShape::shape)
        .field("position", &PlacedShape::position)
        .field("rotation", &PlacedShape::rotation);

    emscripten::value_object<PlacedItem>("PlacedItem")
        .field("id", &PlacedItem::id)
        .field("shape", &PlacedItem::shape);

    emscripten::value_object<DoorRec>("DoorRec")
        .field("id", &DoorRec::id)
        .field("wallIndex", &DoorRec::wallIndex)
        .field("position", &DoorRec::position)
        .field("anchor", &DoorRec::anchor)
        .field("width", &DoorRec::width)
        .field("hingeSide", &DoorRec::hingeSide)
        .field("openDirection", &DoorRec::openDirection);

    emscripten::value_object<RoomRec>("RoomRec")
        .field("id", &RoomRec::id)
        .field("name", &RoomRec::name)
        .field("vertices", &RoomRec::vertices)
        .field("position", &RoomRec::position)
        .field("doors", &RoomRec::doors);

    emscripten::value_object<WallSegment>("WallSegment")
        .field("start", &WallSegment::start)
        .field("end", &WallSegment::end)
        .field("length", &WallSegment::length)
        .field("exactLength", &WallSegment::exactLength)
        .field("index", &WallSegment::index);

    emscripten::value_object<DoorGeometry>("DoorGeometry")
        .field("doorStart", &DoorGeometry::doorStart)
        .field("doorEnd", &DoorGeometry::doorEnd)
        .field("doorCenter", &DoorGeometry::doorCenter)
        .field("hingePoint", &DoorGeometry::hingePoint)
        .field("openEnd", &DoorGeometry::openEnd)
        .field("swingStartPoint", &DoorGeometry::swingStartPoint)
        .field("swingEndPoint", &DoorGeometry::swingEndPoint)
        .field("swingRadius", &DoorGeometry::swingRadius)
        .field("sweepFlag", &DoorGeometry::sweepFlag)
        .field("segmentAngle", &DoorGeometry::segmentAngle);

    emscripten::value_object<DoorGeometryResult>("DoorGeometryResult")
        .field("geometry", &DoorGeometryResult::geometry)
        .field("valid", &DoorGeometryResult::valid);

    emscripten::value_object<PlacementVerdict>("PlacementVerdict")
        .field("isValid", &PlacementVerdict::isValid)
        .field("reasons", &PlacementVerdict::reasons);

    emscripten::value_object<PositionResult>("PositionResult")
        .field("position", &PositionResult::position)
        .field("valid", &PositionResult::valid);

    emscripten::value_object<WallSnapResult>("WallSnapResult")
        .field("wallIndex", &WallSnapResult::wallIndex)
        .field("positionOnWall", &WallSnapResult::positionOnWall)
        .field("centerOffset", &WallSnapResult::centerOffset)
        .field("fraction", &WallSnapResult::fraction)
        .field("point", &WallSnapResult::point)
        .field("wallAngle", &WallSnapResult::wallAngle)
        .field("distance", &WallSnapResult::distance);

    emscripten::value_object<WallSnapBindingResult>("WallSnapBindingResult")
        .field("snap", &WallSnapBindingResult::snap)
        .field("valid", &WallSnapBindingResult::valid);

    emscripten::value_object<MeasurementParseResult>("MeasurementParseResult")
        .field("eighths", &MeasurementParseResult::eighths)
        .field("valid", &MeasurementParseResult::valid);

    emscripten::value_object<SessionOutcome>("SessionOutcome")
        .field("status", &SessionOutcome::status)
        .field("item", &SessionOutcome::item);

    // Shapes and walls
    emscripten::function("resolveRing", &resolveRing);
    emscripten::function("boundingBox", &boundingBox);
    emscripten::function("wallSegments", emscripten::optional_override([](const Ring& ring, const Point2& offset) {
        return wallSegments(ring, offset);
    }));

    // Doors
    emscripten::function("doorGeometry", emscripten::optional_override([](const Point2& v1, const Point2& v2, float position, DoorAnchor anchor, float width, HingeSide hinge, OpenDirection direction) {
        const auto g = doorGeometry(v1, v2, position, anchor, width, hinge, direction);
        return g ? DoorGeometryResult{ *g, true } : DoorGeometryResult{ DoorGeometry{}, false };
    }));
    emscripten::function("doorGeometryForRoom", emscripten::optional_override([](const DoorRec& door, const RoomRec& room) {
        const auto g = doorGeometryForRoom(door, room);
        return g ? DoorGeometryResult{ *g, true } : DoorGeometryResult{ DoorGeometry{}, false };
    }));
    emscripten::function("interiorOpenDirection", &interiorOpenDirection);

    // Validation
    emscripten::function("isValidPlacement", emscripten::optional_override([](const PlacedShape& candidate, const RoomRec& room, const std::vector<PlacedItem>& others, std::uint32_t excludeId) {
        return isValidPlacement(candidate, room, others, excludeId);
    }));
    emscripten::function("findNearestValidPosition", emscripten::optional_override([](const PlacedShape& candidate, const RoomRec& room, const std::vector<PlacedItem>& others, float maxRadius, float step, std::uint32_t excludeId) {
        const auto p = findNearestValidPosition(candidate, room, others, SearchOptions{ maxRadius, step }, excludeId);
        return p ? PositionResult{ *p, true } : PositionResult{ Point2{ 0.0f, 0.0f }, false };
    }));
    emscripten::function("checkRoomCollision", &checkRoomCollision);
    emscripten::function("validateRoomPlacement", &validateRoomPlacement);
    emscripten::function("validRotations", emscripten::optional_override([](const PlacedShape& placed, const RoomRec& room, const std::vector<PlacedItem>& others, std::uint32_t excludeId) {
        return validRotations(placed, room, others, excludeId);
    }));

    // Hit testing and measurement
    emscripten::function("hitTestRoom", &hitTestRoom);
    emscripten::function("furnitureWallClearance", &furnitureWallClearance);

    // Snapping
    emscripten::function("snapPointToGrid", &snapPointToGrid);
    emscripten::function("calculateSnappedRoomPosition", &calculateSnappedRoomPosition);
    emscripten::function("findClosestWallPoint", emscripten::optional_override([](const Point2& p, const std::vector<WallSegment>& walls, float doorWidth, float maxDistance) {
        const auto s = findClosestWallPoint(p, walls, doorWidth, maxDistance);
        return s ? WallSnapBindingResult{ *s, true } : WallSnapBindingResult{ WallSnapResult{}, false };
    }));

    // Measurements
    emscripten::function("formatEighths", &formatEighths);
    emscripten::function("parseToEighths", emscripten::optional_override([](const std::string& text) {
        const auto v = parseToEighths(text);
        return v ? MeasurementParseResult{ *v, true } : MeasurementParseResult{ 0, false };
    }));

    emscripten::class_<PlacementSession>("PlacementSession")
        .constructor<>()
        .function("mode", &PlacementSession::mode)
        .function("isActive", &PlacementSession::isActive)
        .function("item", emscripten::optional_override([](const PlacementSession& self) { return self.item(); }))
        .function("verdict", emscripten::optional_override([](const PlacementSession& self) { return self.verdict(); }))
        .function("beginPlacement", &PlacementSession::beginPlacement)
        .function("beginMove", &PlacementSession::beginMove)
        .function("updateCursor", &PlacementSession::updateCursor)
        .function("rotate", &PlacementSession::rotate)
        .function("commit", &PlacementSession::commit)
        .function("cancel", &PlacementSession::cancel);
}
#endif
