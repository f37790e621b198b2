#pragma once

#include "Types.h"
#include "Grid.h"
#include "Color.h"
#include "RegionStore.h"
#include "history/ICommand.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace GridPlanner {

class Store;
class ChangeDispatcher;
class ValidationError;
struct UserState;

enum class ActionStatus {
    Applied,    // State changed, undo entry recorded where applicable
    NoOp,       // Nothing to do; not an error
    Rejected    // Invalid request; nothing changed
};

/**
 * Outcome of a mutating Planner call.
 */
struct ActionResult {
    ActionStatus status = ActionStatus::NoOp;
    std::string message;
    size_t count = 0;                       // Cells changed by a fill
    RegionId regionId = EMPTY_REGION_ID;    // Region created by an add
    
    bool Applied() const { return status == ActionStatus::Applied; }
    bool Rejected() const { return status == ActionStatus::Rejected; }
};

/**
 * Facade used by UI and tool-input code. Every change to workspace data
 * goes through here and therefore through a command in the acting user's
 * history. Workspaces and users are created on first use.
 */
class Planner {
public:
    Planner(Store& store, ChangeDispatcher& events);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    GridDescriptor GetGrid(WorkspaceId workspace, SurfaceId surface);
    
    /**
     * Regions in display order, Empty first.
     */
    std::vector<Region> GetRegions(WorkspaceId workspace);
    std::optional<Region> GetRegion(WorkspaceId workspace, RegionId id);
    
    RegionId CellAt(WorkspaceId workspace, SurfaceId surface, int x, int y);
    CellCoord TileToCell(WorkspaceId workspace, SurfaceId surface,
                         double worldX, double worldY);
    CellBounds GetCellBounds(WorkspaceId workspace, SurfaceId surface,
                             int x, int y);
    
    bool CanUndo(UserId user) const;
    bool CanRedo(UserId user) const;
    std::string PeekUndoDescription(UserId user) const;
    std::string PeekRedoDescription(UserId user) const;
    
    RegionId GetSelectedRegion(UserId user) const;
    std::optional<std::string> GetSelectedTool(UserId user) const;
    int GetVisibility(UserId user) const;
    
    // ========================================================================
    // Workspace mutations (recorded in the user's history)
    // ========================================================================
    
    /**
     * Assign every cell touched by a world rectangle to a region.
     * An absent or Empty region erases. result.count is the number of
     * cells that changed; 0 is a no-op.
     */
    ActionResult FillRectangle(WorkspaceId workspace, UserId user,
                               SurfaceId surface,
                               std::optional<RegionId> region,
                               const WorldPoint& topLeft,
                               const WorldPoint& bottomRight);
    
    /**
     * result.regionId is the new region's id.
     */
    ActionResult AddRegion(WorkspaceId workspace, UserId user,
                           const std::string& name, const Color& color);
    
    ActionResult EditRegion(WorkspaceId workspace, UserId user,
                            RegionId id,
                            const std::optional<std::string>& name,
                            const std::optional<Color>& color);
    
    /**
     * Delete a region, moving its cells to the replacement (absent or
     * Empty erases them).
     */
    ActionResult DeleteRegion(WorkspaceId workspace, UserId user,
                              RegionId id,
                              std::optional<RegionId> replacement);
    
    /**
     * Move a region up (delta < 0) or down (delta > 0) the display order.
     */
    ActionResult MoveRegion(WorkspaceId workspace, UserId user,
                            RegionId id, int delta);
    
    /**
     * Change a surface's grid. With reproject the existing cells are
     * resampled onto the new grid, otherwise they keep their coordinates.
     */
    ActionResult SetGrid(WorkspaceId workspace, UserId user,
                         SurfaceId surface, const GridDescriptor& grid,
                         bool reproject);
    
    ActionResult Undo(UserId user);
    ActionResult Redo(UserId user);
    
    // ========================================================================
    // User state (not recorded in history)
    // ========================================================================
    
    /**
     * Level is clamped to 0..3.
     */
    ActionResult SetVisibility(UserId user, int level);
    
    ActionResult SetSelectedRegion(WorkspaceId workspace, UserId user,
                                   std::optional<RegionId> region);
    
    ActionResult SetSelectedTool(UserId user,
                                 const std::optional<std::string>& tool);
    
    // ========================================================================
    // Administrative resets (irreversible)
    // ========================================================================
    
    void ResetWorkspace(WorkspaceId workspace);
    void ResetSurface(WorkspaceId workspace, SurfaceId surface);
    void ResetUser(UserId user);
    void ResetAll();
    
private:
    CommandHeader MakeHeader(WorkspaceId workspace, UserId user);
    
    /**
     * Move a user into a workspace, notifying if that cleared their
     * selection.
     */
    UserState& Attach(UserId user, WorkspaceId workspace);
    
    /**
     * Push a created command onto the user's history. A null command is
     * reported as a no-op. The user joins the command's workspace only
     * once the command is about to run.
     */
    ActionResult Submit(UserId user, std::unique_ptr<ICommand> cmd,
                        const char* noOpMessage);
    
    ActionResult Reject(const char* action, const ValidationError& e);
    
    Store& m_store;
    ChangeDispatcher& m_events;
};

} // namespace GridPlanner
