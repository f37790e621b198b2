#pragma once

#include "Types.h"
#include "Limits.h"
#include "history/History.h"
#include <optional>
#include <string>

namespace GridPlanner {

/**
 * Per-user session state: selection, tool, boundary visibility and the
 * user's own undo/redo history.
 */
struct UserState {
    explicit UserState(UserId id = 0,
                       int visibility = Limits::DEFAULT_VISIBILITY_LEVEL,
                       size_t undoCapacity = Limits::DEFAULT_UNDO_CAPACITY)
        : id(id), boundaryVisibility(visibility), history(undoCapacity) {}
    
    UserId id;
    std::optional<WorkspaceId> workspace;   // Last workspace acted in
    RegionId selectedRegionId = EMPTY_REGION_ID;
    std::optional<std::string> selectedTool;
    int boundaryVisibility;
    History history;
};

} // namespace GridPlanner
