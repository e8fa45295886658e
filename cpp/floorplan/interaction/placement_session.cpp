#include "floorplan/interaction/placement_session.h"
#include "floorplan/core/logging.h"
#include "floorplan/placement/nearest_position.h"
#include "floorplan/placement/placement_validator.h"
#include "floorplan/shape/shape_resolution.h"
#include "floorplan/snapping/snap_solver.h"

namespace floorplan {

PlacementSession::PlacementSession(const EngineConfig& config) : config_(config) {}

std::uint32_t PlacementSession::excludeId() const noexcept {
    return session_.mode == SessionMode::Moving ? session_.original.id : kNoId;
}

void PlacementSession::validate(const RoomRec& room, const std::vector<PlacedItem>& others) {
    session_.verdict = isValidPlacement(session_.current.shape, room, others, excludeId());
    if (session_.verdict.isValid) {
        session_.lastValid = session_.current;
        session_.hasLastValid = true;
    }
}

SessionOutcome PlacementSession::finish(SessionStatus status, const PlacedItem& item) {
    SessionOutcome outcome;
    outcome.status = status;
    outcome.item = item;
    session_ = SessionState{};
    return outcome;
}

bool PlacementSession::beginPlacement(const PlacedItem& item, const Point2& cursor, const RoomRec& room, const std::vector<PlacedItem>& others) {
    if (isActive()) return false;

    session_ = SessionState{};
    session_.mode = SessionMode::Placing;
    session_.original = item;
    session_.current = item;
    FLOORPLAN_LOG_DEBUG("placement of item %u started", item.id);
    updateCursor(cursor, room, others);
    return true;
}

bool PlacementSession::beginMove(const PlacedItem& item, const RoomRec& room, const std::vector<PlacedItem>& others) {
    if (isActive()) return false;

    session_ = SessionState{};
    session_.mode = SessionMode::Moving;
    session_.original = item;
    session_.current = item;
    validate(room, others);
    FLOORPLAN_LOG_DEBUG("move of item %u started", item.id);
    return true;
}

bool PlacementSession::updateCursor(const Point2& cursor, const RoomRec& room, const std::vector<PlacedItem>& others) {
    if (!isActive()) return false;

    const Point2 snapped = snapPointToGrid(cursor, config_.gridSize);
    session_.current.shape = placedAtCenter(session_.current.shape.shape, snapped, session_.current.shape.rotation);
    validate(room, others);
    return session_.verdict.isValid;
}

bool PlacementSession::rotate(bool clockwise, const RoomRec& room, const std::vector<PlacedItem>& others) {
    if (!isActive()) return false;

    PlacedShape turned = session_.current.shape;
    turned.rotation = clockwise ? rotateClockwise(turned.rotation) : rotateCounterClockwise(turned.rotation);
    if (!isValidPlacement(turned, room, others, excludeId()).isValid) {
        FLOORPLAN_LOG_DEBUG("rotation of item %u to %d rejected", session_.current.id, rotationDegrees(turned.rotation));
        return false;
    }

    session_.current.shape = turned;
    validate(room, others);
    return true;
}

SessionOutcome PlacementSession::commit(const RoomRec& room, const std::vector<PlacedItem>& others) {
    if (!isActive()) return SessionOutcome{};

    validate(room, others);
    if (session_.verdict.isValid) {
        return finish(SessionStatus::Confirmed, session_.current);
    }

    if (const auto nearest = findNearestValidPosition(session_.current.shape, room, others, searchOptionsFrom(config_), excludeId())) {
        PlacedItem moved = session_.current;
        moved.shape.position = *nearest;
        FLOORPLAN_LOG_DEBUG("item %u committed at nearest valid position", moved.id);
        return finish(SessionStatus::Confirmed, moved);
    }

    if (session_.hasLastValid) {
        FLOORPLAN_LOG_DEBUG("item %u reverted to last valid position", session_.current.id);
        return finish(SessionStatus::Confirmed, session_.lastValid);
    }

    FLOORPLAN_LOG_WARN("item %u has no valid position, placement cancelled", session_.current.id);
    return cancel();
}

SessionOutcome PlacementSession::cancel() {
    if (!isActive()) return SessionOutcome{};
    return finish(SessionStatus::Cancelled, session_.original);
}

} // namespace floorplan
