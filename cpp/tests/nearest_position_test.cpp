#include "tests/floorplan_test_common.h"
#include "floorplan/placement/nearest_position.h"
#include "floorplan/placement/placement_validator.h"

#include <limits>

using namespace floorplan;
using namespace floorplan_test;

TEST(NearestPositionTest, ValidCandidateStaysPut) {
    const RoomRec room = makeTestRoom();
    const PlacedShape candidate = squareAt(60, 48);
    const auto found = findNearestValidPosition(candidate, room, {});
    ASSERT_TRUE(found.has_value());
    expectNear(*found, candidate.position, 0.0f);
}

TEST(NearestPositionTest, StackedItemConverges) {
    const RoomRec room = makeTestRoom();
    const std::vector<PlacedItem> others{ itemAt(1, 60, 48) };
    PlacedShape candidate = squareAt(60, 48);
    ASSERT_FALSE(isValidPlacement(candidate, room, others).isValid);

    const auto found = findNearestValidPosition(candidate, room, others, SearchOptions{ 48.0f, 0.5f });
    ASSERT_TRUE(found.has_value());

    candidate.position = *found;
    EXPECT_TRUE(isValidPlacement(candidate, room, others).isValid);

    const float dx = found->x - 48.0f;
    const float dy = found->y - 36.0f;
    EXPECT_LE(std::sqrt(dx * dx + dy * dy), 48.0f + 1.0f);
    EXPECT_GE(std::sqrt(dx * dx + dy * dy), 24.0f - 1.0f);
}

TEST(NearestPositionTest, NudgesBackInsideWall) {
    const RoomRec room = makeTestRoom();
    const auto found = findNearestValidPosition(squareAt(11, 48), room, {});
    ASSERT_TRUE(found.has_value());
    expectNear(*found, { 0, 36 }, 0.0f);
}

TEST(NearestPositionTest, ResultsSnapToHalfInch) {
    const RoomRec room = makeTestRoom();
    const std::vector<PlacedItem> others{ itemAt(1, 60, 48) };
    const auto found = findNearestValidPosition(squareAt(61.3f, 47.1f), room, others, SearchOptions{ 40.0f, 0.5f });
    ASSERT_TRUE(found.has_value());
    EXPECT_FLOAT_EQ(found->x * 2.0f, std::round(found->x * 2.0f));
    EXPECT_FLOAT_EQ(found->y * 2.0f, std::round(found->y * 2.0f));
}

TEST(NearestPositionTest, ExhaustionReturnsNothing) {
    const RoomRec room = makeTestRoom();
    const std::vector<PlacedItem> others{ itemAt(1, 60, 48) };
    EXPECT_FALSE(findNearestValidPosition(squareAt(60, 48), room, others, SearchOptions{ 2.0f, 0.5f }).has_value());

    // Larger than the room: nothing fits anywhere.
    const PlacedShape huge = placedAtCenter(ShapeTemplate::rectangle(200, 200), { 60, 48 });
    EXPECT_FALSE(findNearestValidPosition(huge, room, {}).has_value());
}

TEST(NearestPositionTest, ExcludedSelfDoesNotBlock) {
    const RoomRec room = makeTestRoom();
    const std::vector<PlacedItem> others{ itemAt(3, 60, 48) };
    const auto found = findNearestValidPosition(squareAt(61, 48), room, others, {}, 3);
    ASSERT_TRUE(found.has_value());
    expectNear(*found, squareAt(61, 48).position, 0.0f);
}

TEST(NearestPositionTest, InvalidOptionsReturnNothing) {
    const RoomRec room = makeTestRoom();
    const std::vector<PlacedItem> others{ itemAt(1, 60, 48) };
    EXPECT_FALSE(findNearestValidPosition(squareAt(60, 48), room, others, SearchOptions{ 12.0f, 0.0f }).has_value());
    EXPECT_FALSE(findNearestValidPosition(squareAt(60, 48), room, others, SearchOptions{ -1.0f, 0.5f }).has_value());
}

TEST(NearestPositionTest, OversizedSearchIsRejected) {
    const RoomRec room = makeTestRoom();
    const std::vector<PlacedItem> others{ itemAt(1, 60, 48) };
    EXPECT_FALSE(findNearestValidPosition(squareAt(60, 48), room, others, SearchOptions{ 1e9f, 1e-6f }).has_value());
    EXPECT_FALSE(findNearestValidPosition(
        squareAt(60, 48), room, others, SearchOptions{ std::numeric_limits<float>::infinity(), 0.5f }).has_value());
    EXPECT_FALSE(findNearestValidPosition(
        squareAt(60, 48), room, others, SearchOptions{ std::numeric_limits<float>::quiet_NaN(), 0.5f }).has_value());
}

TEST(NearestPositionTest, SearchOptionsFromConfig) {
    EngineConfig config;
    config.searchRadius = 30.0f;
    config.searchStep = 1.0f;
    const SearchOptions options = searchOptionsFrom(config);
    EXPECT_FLOAT_EQ(options.maxRadius, 30.0f);
    EXPECT_FLOAT_EQ(options.step, 1.0f);
}
