#include "tests/floorplan_test_common.h"
#include "floorplan/door/door_geometry.h"
#include "floorplan/geometry/primitives.h"
#include "floorplan/walls/wall_segments.h"

using namespace floorplan;
using namespace floorplan_test;

TEST(DoorGeometryTest, HorizontalWallOutwardLeftHinge) {
    const auto g = doorGeometry({ 0, 0 }, { 100, 0 }, 0.5f, DoorAnchor::FractionCenter, 32.0f,
        HingeSide::Left, OpenDirection::Outward);
    ASSERT_TRUE(g.has_value());
    expectNear(g->doorCenter, { 50, 0 });
    expectNear(g->doorStart, { 34, 0 });
    expectNear(g->doorEnd, { 66, 0 });
    expectNear(g->hingePoint, g->doorStart);
    expectNear(g->openEnd, g->doorEnd);
    expectNear(g->swingStartPoint, g->openEnd);
    expectNear(g->swingEndPoint, { 34, 32 });
    EXPECT_FLOAT_EQ(g->swingRadius, 32.0f);
    EXPECT_EQ(g->sweepFlag, 1);

    const auto again = doorGeometry({ 0, 0 }, { 100, 0 }, 0.5f, DoorAnchor::FractionCenter, 32.0f,
        HingeSide::Left, OpenDirection::Outward);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->sweepFlag, g->sweepFlag);
}

TEST(DoorGeometryTest, InwardFlipsSwingSide) {
    const auto out = doorGeometry({ 0, 0 }, { 100, 0 }, 0.5f, DoorAnchor::FractionCenter, 32.0f,
        HingeSide::Left, OpenDirection::Outward);
    const auto in = doorGeometry({ 0, 0 }, { 100, 0 }, 0.5f, DoorAnchor::FractionCenter, 32.0f,
        HingeSide::Left, OpenDirection::Inward);
    ASSERT_TRUE(out && in);
    expectNear(in->swingEndPoint, { 34, -32 });
    EXPECT_NE(in->sweepFlag, out->sweepFlag);
}

TEST(DoorGeometryTest, RightHingeUsesDoorEnd) {
    const auto g = doorGeometry({ 0, 0 }, { 100, 0 }, 0.5f, DoorAnchor::FractionCenter, 32.0f,
        HingeSide::Right, OpenDirection::Outward);
    ASSERT_TRUE(g.has_value());
    expectNear(g->hingePoint, { 66, 0 });
    expectNear(g->openEnd, { 34, 0 });
    expectNear(g->swingEndPoint, { 66, 32 });
    EXPECT_EQ(g->sweepFlag, 0);
}

TEST(DoorGeometryTest, AnchorsAgreeOnCenter) {
    const auto fraction = doorGeometry({ 0, 0 }, { 100, 0 }, 0.25f, DoorAnchor::FractionCenter, 30.0f,
        HingeSide::Left, OpenDirection::Inward);
    const auto center = doorGeometry({ 0, 0 }, { 100, 0 }, 25.0f, DoorAnchor::OffsetCenter, 30.0f,
        HingeSide::Left, OpenDirection::Inward);
    const auto start = doorGeometry({ 0, 0 }, { 100, 0 }, 10.0f, DoorAnchor::OffsetStart, 30.0f,
        HingeSide::Left, OpenDirection::Inward);
    ASSERT_TRUE(fraction && center && start);
    expectNear(fraction->doorCenter, { 25, 0 });
    expectNear(center->doorCenter, { 25, 0 });
    expectNear(start->doorCenter, { 25, 0 });
    expectNear(start->doorStart, { 10, 0 });
}

TEST(DoorGeometryTest, DegenerateInputsHaveNoGeometry) {
    EXPECT_FALSE(doorGeometry({ 5, 5 }, { 5, 5 }, 0.5f, DoorAnchor::FractionCenter, 32.0f,
        HingeSide::Left, OpenDirection::Inward).has_value());
    EXPECT_FALSE(doorGeometry({ 0, 0 }, { 100, 0 }, 0.5f, DoorAnchor::FractionCenter, 0.0f,
        HingeSide::Left, OpenDirection::Inward).has_value());
}

TEST(DoorGeometryTest, InwardSwingEntersEngineWoundRoom) {
    RoomRec room = makeTestRoom();
    room.position = { 200, 100 };
    const Ring world = roomWorldRing(room);
    const auto walls = wallSegments(room.vertices, room.position);

    for (const WallSegment& w : walls) {
        DoorRec door{ 1, w.index, 0.5f, DoorAnchor::FractionCenter, 30.0f, HingeSide::Left, OpenDirection::Inward };
        const auto g = doorGeometryForRoom(door, room);
        ASSERT_TRUE(g.has_value());
        EXPECT_TRUE(pointInPolygon(g->swingEndPoint, world)) << "wall " << w.index;

        door.openDirection = OpenDirection::Outward;
        const auto out = doorGeometryForRoom(door, room);
        ASSERT_TRUE(out.has_value());
        EXPECT_FALSE(pointInPolygon(out->swingEndPoint, world)) << "wall " << w.index;
    }
}

TEST(DoorGeometryTest, InwardSwingEntersCounterClockwiseRoom) {
    RoomRec room = makeTestRoom();
    room.vertices = { { 0, 0 }, { 120, 0 }, { 120, 96 }, { 0, 96 } };
    const Ring world = roomWorldRing(room);

    for (std::uint32_t wall = 0; wall < 4; ++wall) {
        DoorRec door{ 1, wall, 0.5f, DoorAnchor::FractionCenter, 30.0f, HingeSide::Left, OpenDirection::Inward };
        const auto g = doorGeometryForRoom(door, room);
        ASSERT_TRUE(g.has_value());
        EXPECT_TRUE(pointInPolygon(g->swingEndPoint, world)) << "wall " << wall;

        door.openDirection = OpenDirection::Outward;
        const auto out = doorGeometryForRoom(door, room);
        ASSERT_TRUE(out.has_value());
        EXPECT_FALSE(pointInPolygon(out->swingEndPoint, world)) << "wall " << wall;
    }
}

TEST(DoorGeometryTest, OutOfRangeWallHasNoGeometry) {
    RoomRec room = makeTestRoom();
    DoorRec door = bottomDoor();
    door.wallIndex = 9;
    EXPECT_FALSE(doorGeometryForRoom(door, room).has_value());
}

TEST(DoorGeometryTest, SwingContainsQuadrantOnly) {
    RoomRec room = makeTestRoom();
    const auto g = doorGeometryForRoom(bottomDoor(), room);
    ASSERT_TRUE(g.has_value());
    expectNear(g->hingePoint, { 44, 96 });
    expectNear(g->swingEndPoint, { 44, 64 });
    EXPECT_EQ(g->sweepFlag, 0);

    EXPECT_TRUE(pointInDoorSwing({ 60, 80 }, *g));
    EXPECT_TRUE(pointInDoorSwing({ 46, 70 }, *g));
    EXPECT_TRUE(pointInDoorSwing({ 44, 96 }, *g));
    // Behind the hinge, outside the room, and beyond the radius.
    EXPECT_FALSE(pointInDoorSwing({ 30, 80 }, *g));
    EXPECT_FALSE(pointInDoorSwing({ 60, 110 }, *g));
    EXPECT_FALSE(pointInDoorSwing({ 70, 70 }, *g));
}

TEST(DoorGeometryTest, SwingArcWithoutWraparound) {
    // Right hinge on the bottom wall, inward: arc spans 180..270 degrees.
    RoomRec room = makeTestRoom();
    const auto g = doorGeometryForRoom(bottomDoor(HingeSide::Right, OpenDirection::Inward), room);
    ASSERT_TRUE(g.has_value());
    expectNear(g->hingePoint, { 76, 96 });
    EXPECT_TRUE(pointInDoorSwing({ 60, 80 }, *g));
    EXPECT_FALSE(pointInDoorSwing({ 90, 80 }, *g));

    // Outward left hinge on the top wall (engine winding runs right to left).
    DoorRec top{ 2, 3, 0.5f, DoorAnchor::FractionCenter, 32.0f, HingeSide::Left, OpenDirection::Outward };
    const auto t = doorGeometryForRoom(top, room);
    ASSERT_TRUE(t.has_value());
    expectNear(t->hingePoint, { 76, 0 });
    EXPECT_TRUE(pointInDoorSwing({ 70, -10 }, *t));
    EXPECT_FALSE(pointInDoorSwing({ 70, 10 }, *t));
}

TEST(DoorGeometryTest, InteriorOpenDirectionHandlesEitherWinding) {
    const Ring ccw{ { 0, 0 }, { 120, 0 }, { 120, 96 }, { 0, 96 } };
    // Bottom wall of the counter-clockwise ring runs right to left.
    const OpenDirection dir = interiorOpenDirection({ 120, 96 }, { 0, 96 }, ccw);
    EXPECT_EQ(dir, OpenDirection::Outward);
    const auto g = doorGeometry({ 120, 96 }, { 0, 96 }, 0.5f, DoorAnchor::FractionCenter, 32.0f, HingeSide::Left, dir);
    ASSERT_TRUE(g.has_value());
    EXPECT_TRUE(pointInPolygon(g->swingEndPoint, ccw));

    const RoomRec room = makeTestRoom();
    EXPECT_EQ(interiorOpenDirection({ 0, 96 }, { 120, 96 }, room.vertices), OpenDirection::Inward);
}
