#include "tests/floorplan_test_common.h"
#include "floorplan/interaction/placement_session.h"
#include "floorplan/placement/placement_validator.h"

using namespace floorplan;
using namespace floorplan_test;

class PlacementSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        room = makeTestRoom();
    }

    PlacedItem newItem(float size = 24.0f) const {
        return PlacedItem{ 20, placedAtCenter(ShapeTemplate::rectangle(size, size), { 0, 0 }) };
    }

    RoomRec room;
    std::vector<PlacedItem> others;
    PlacementSession session;
};

TEST_F(PlacementSessionTest, StartsIdle) {
    EXPECT_EQ(session.mode(), SessionMode::Idle);
    EXPECT_FALSE(session.isActive());
    EXPECT_FALSE(session.updateCursor({ 60, 48 }, room, others));
    EXPECT_FALSE(session.rotate(true, room, others));
    EXPECT_EQ(session.commit(room, others).status, SessionStatus::Cancelled);
    EXPECT_EQ(session.cancel().status, SessionStatus::Cancelled);
}

TEST_F(PlacementSessionTest, PlacementCentersOnSnappedCursor) {
    ASSERT_TRUE(session.beginPlacement(newItem(), { 60.2f, 48.3f }, room, others));
    EXPECT_EQ(session.mode(), SessionMode::Placing);
    expectNear(session.item().shape.position, { 48.0f, 36.5f });
    EXPECT_TRUE(session.verdict().isValid);
    EXPECT_TRUE(session.hasLastValid());

    EXPECT_FALSE(session.beginPlacement(newItem(), { 30, 30 }, room, others));
    EXPECT_FALSE(session.beginMove(newItem(), room, others));
}

TEST_F(PlacementSessionTest, GridSizeComesFromConfig) {
    EngineConfig config;
    config.gridSize = 6.0f;
    PlacementSession coarse(config);
    ASSERT_TRUE(coarse.beginPlacement(newItem(), { 61, 50 }, room, others));
    expectNear(placedCenter(coarse.item().shape), { 60, 48 });
}

TEST_F(PlacementSessionTest, UpdateCursorTracksValidity) {
    others.push_back(itemAt(5, 60, 48));
    ASSERT_TRUE(session.beginPlacement(newItem(), { 24, 24 }, room, others));
    EXPECT_TRUE(session.verdict().isValid);

    EXPECT_FALSE(session.updateCursor({ 60, 48 }, room, others));
    EXPECT_TRUE(session.verdict().has(ViolationKind::FurnitureOverlap));
    // Last valid pose is retained while the cursor sits on an invalid spot.
    expectNear(placedCenter(session.lastValid().shape), { 24, 24 });

    EXPECT_TRUE(session.updateCursor({ 96, 24 }, room, others));
    expectNear(placedCenter(session.lastValid().shape), { 96, 24 });
}

TEST_F(PlacementSessionTest, CommitValidPosition) {
    ASSERT_TRUE(session.beginPlacement(newItem(), { 60, 48 }, room, others));
    const SessionOutcome outcome = session.commit(room, others);
    EXPECT_EQ(outcome.status, SessionStatus::Confirmed);
    EXPECT_EQ(outcome.item.id, 20u);
    expectNear(outcome.item.shape.position, { 48, 36 });
    EXPECT_EQ(session.mode(), SessionMode::Idle);
}

TEST_F(PlacementSessionTest, CommitFallsBackToNearestValid) {
    others.push_back(itemAt(5, 60, 70));
    ASSERT_TRUE(session.beginPlacement(newItem(), { 60, 48 }, room, others));
    EXPECT_FALSE(session.verdict().isValid);
    EXPECT_FALSE(session.hasLastValid());

    const SessionOutcome outcome = session.commit(room, others);
    EXPECT_EQ(outcome.status, SessionStatus::Confirmed);
    EXPECT_TRUE(isValidPlacement(outcome.item.shape, room, others).isValid);
    EXPECT_LE(outcome.item.shape.position.y, 34.0f);
    EXPECT_NEAR(outcome.item.shape.position.x, 48.0f, 2.0f);
}

TEST_F(PlacementSessionTest, CommitFallsBackToLastValid) {
    others.push_back(itemAt(5, 60, 48));
    ASSERT_TRUE(session.beginPlacement(newItem(), { 30, 48 }, room, others));
    EXPECT_FALSE(session.updateCursor({ 60, 48 }, room, others));

    const SessionOutcome outcome = session.commit(room, others);
    EXPECT_EQ(outcome.status, SessionStatus::Confirmed);
    expectNear(outcome.item.shape.position, { 18, 36 });
}

TEST_F(PlacementSessionTest, CommitCancelsWithoutAnyValidPosition) {
    others.push_back(itemAt(5, 60, 48));
    ASSERT_TRUE(session.beginPlacement(newItem(), { 60, 48 }, room, others));

    const SessionOutcome outcome = session.commit(room, others);
    EXPECT_EQ(outcome.status, SessionStatus::Cancelled);
    EXPECT_EQ(outcome.item.id, 20u);
    EXPECT_FALSE(session.isActive());
}

TEST_F(PlacementSessionTest, MoveIgnoresOwnPreviousPose) {
    const PlacedItem chair = itemAt(9, 60, 48);
    others.push_back(chair);

    ASSERT_TRUE(session.beginMove(chair, room, others));
    EXPECT_EQ(session.mode(), SessionMode::Moving);
    EXPECT_TRUE(session.verdict().isValid);
    EXPECT_TRUE(session.updateCursor({ 66, 48 }, room, others));

    PlacementSession placing;
    ASSERT_TRUE(placing.beginPlacement(chair, { 60, 48 }, room, others));
    EXPECT_TRUE(placing.verdict().has(ViolationKind::FurnitureOverlap));
}

TEST_F(PlacementSessionTest, CancelRestoresOriginal) {
    const PlacedItem chair = itemAt(9, 30, 30);
    ASSERT_TRUE(session.beginMove(chair, room, others));
    EXPECT_TRUE(session.updateCursor({ 80, 60 }, room, others));
    EXPECT_TRUE(session.rotate(true, room, others));

    const SessionOutcome outcome = session.cancel();
    EXPECT_EQ(outcome.status, SessionStatus::Cancelled);
    expectNear(outcome.item.shape.position, chair.shape.position);
    EXPECT_EQ(outcome.item.shape.rotation, Rotation::Deg0);
    EXPECT_EQ(session.mode(), SessionMode::Idle);
}

TEST_F(PlacementSessionTest, RotateOnlyWhenResultIsValid) {
    PlacedItem bench{ 21, placedAtCenter(ShapeTemplate::rectangle(100, 20), { 0, 0 }) };
    ASSERT_TRUE(session.beginPlacement(bench, { 60, 48 }, room, others));
    EXPECT_TRUE(session.verdict().isValid);

    EXPECT_FALSE(session.rotate(true, room, others));
    EXPECT_EQ(session.item().shape.rotation, Rotation::Deg0);

    session.cancel();
    ASSERT_TRUE(session.beginPlacement(newItem(20), { 60, 48 }, room, others));
    EXPECT_TRUE(session.rotate(true, room, others));
    EXPECT_EQ(session.item().shape.rotation, Rotation::Deg90);
    EXPECT_TRUE(session.rotate(false, room, others));
    EXPECT_TRUE(session.rotate(false, room, others));
    EXPECT_EQ(session.item().shape.rotation, Rotation::Deg270);
}

TEST_F(PlacementSessionTest, RotationSurvivesCursorUpdates) {
    PlacedItem bench{ 21, placedAtCenter(ShapeTemplate::rectangle(60, 20), { 0, 0 }) };
    ASSERT_TRUE(session.beginPlacement(bench, { 60, 48 }, room, others));
    ASSERT_TRUE(session.rotate(true, room, others));
    EXPECT_TRUE(session.updateCursor({ 40, 48 }, room, others));
    EXPECT_EQ(session.item().shape.rotation, Rotation::Deg90);
    expectNear(placedCenter(session.item().shape), { 40, 48 });
}
