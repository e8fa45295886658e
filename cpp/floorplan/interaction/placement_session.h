#pragma once

#include "floorplan/core/engine_config.h"
#include "floorplan/core/types.h"
#include "floorplan/layout/layout_types.h"

#include <cstdint>
#include <vector>

namespace floorplan {

enum class SessionMode : std::uint8_t {
    Idle = 0,
    Placing = 1, // new item following the cursor
    Moving = 2,  // existing item being dragged
};

enum class SessionStatus : std::uint8_t {
    Confirmed = 0,
    Cancelled = 1,
};

struct SessionOutcome {
    SessionStatus status{SessionStatus::Cancelled};
    PlacedItem item;
};

// Drives one furniture placement or move. Geometry is world frame; `others`
// is the current snapshot of every other item and may include the moving
// item's own pre-drag state. Calls that do not fit the current mode are
// ignored and report false (or a Cancelled outcome).
class PlacementSession {
public:
    explicit PlacementSession(const EngineConfig& config = {});

    // ==============================================================================
    // State Query
    // ==============================================================================
    SessionMode mode() const noexcept { return session_.mode; }
    bool isActive() const noexcept { return session_.mode != SessionMode::Idle; }
    const PlacedItem& item() const noexcept { return session_.current; }
    const PlacementVerdict& verdict() const noexcept { return session_.verdict; }
    bool hasLastValid() const noexcept { return session_.hasLastValid; }
    const PlacedItem& lastValid() const noexcept { return session_.lastValid; }

    // ==============================================================================
    // Transitions
    // ==============================================================================
    bool beginPlacement(const PlacedItem& item, const Point2& cursor, const RoomRec& room, const std::vector<PlacedItem>& others);
    bool beginMove(const PlacedItem& item, const RoomRec& room, const std::vector<PlacedItem>& others);

    // Centers the item on the grid-snapped cursor. Returns the new validity.
    bool updateCursor(const Point2& cursor, const RoomRec& room, const std::vector<PlacedItem>& others);

    // Applies a quarter turn only when the turned item is valid.
    bool rotate(bool clockwise, const RoomRec& room, const std::vector<PlacedItem>& others);

    // Valid position, else nearest valid, else last valid, else Cancelled.
    SessionOutcome commit(const RoomRec& room, const std::vector<PlacedItem>& others);

    SessionOutcome cancel();

private:
    struct SessionState {
        SessionMode mode = SessionMode::Idle;
        PlacedItem original;
        PlacedItem current;
        PlacedItem lastValid;
        bool hasLastValid = false;
        PlacementVerdict verdict;
    };

    std::uint32_t excludeId() const noexcept;
    void validate(const RoomRec& room, const std::vector<PlacedItem>& others);
    SessionOutcome finish(SessionStatus status, const PlacedItem& item);

    EngineConfig config_;
    SessionState session_;
};

} // namespace floorplan
