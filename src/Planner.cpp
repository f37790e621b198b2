#include "Planner.h"
#include "Store.h"
#include "Errors.h"
#include "Limits.h"
#include "Notifications.h"
#include "history/Commands.h"
#include "platform/Time.h"
#include <SDL3/SDL.h>
#include <algorithm>

namespace GridPlanner {

Planner::Planner(Store& store, ChangeDispatcher& events)
    : m_store(store), m_events(events) {}

// ============================================================================
// Queries
// ============================================================================

GridDescriptor Planner::GetGrid(WorkspaceId workspace, SurfaceId surface) {
    return m_store.EnsureWorkspace(workspace).GetGrid(surface);
}

std::vector<Region> Planner::GetRegions(WorkspaceId workspace) {
    return m_store.EnsureWorkspace(workspace).regions.GetOrdered(true);
}

std::optional<Region> Planner::GetRegion(WorkspaceId workspace, 
                                         RegionId id) {
    const Region* region = m_store.EnsureWorkspace(workspace).regions.Find(id);
    if (!region) {
        return std::nullopt;
    }
    return *region;
}

RegionId Planner::CellAt(WorkspaceId workspace, SurfaceId surface, 
                         int x, int y) {
    return m_store.EnsureWorkspace(workspace).GetCell(surface, {x, y});
}

CellCoord Planner::TileToCell(WorkspaceId workspace, SurfaceId surface,
                              double worldX, double worldY) {
    return CellOf(GetGrid(workspace, surface), worldX, worldY);
}

CellBounds Planner::GetCellBounds(WorkspaceId workspace, SurfaceId surface,
                                  int x, int y) {
    return BoundsOf(GetGrid(workspace, surface), x, y);
}

bool Planner::CanUndo(UserId user) const {
    const UserState* state = m_store.FindUser(user);
    return state && state->history.CanUndo();
}

bool Planner::CanRedo(UserId user) const {
    const UserState* state = m_store.FindUser(user);
    return state && state->history.CanRedo();
}

std::string Planner::PeekUndoDescription(UserId user) const {
    const UserState* state = m_store.FindUser(user);
    return state ? state->history.GetUndoDescription() : "";
}

std::string Planner::PeekRedoDescription(UserId user) const {
    const UserState* state = m_store.FindUser(user);
    return state ? state->history.GetRedoDescription() : "";
}

RegionId Planner::GetSelectedRegion(UserId user) const {
    const UserState* state = m_store.FindUser(user);
    return state ? state->selectedRegionId : EMPTY_REGION_ID;
}

std::optional<std::string> Planner::GetSelectedTool(UserId user) const {
    const UserState* state = m_store.FindUser(user);
    return state ? state->selectedTool : std::nullopt;
}

int Planner::GetVisibility(UserId user) const {
    const UserState* state = m_store.FindUser(user);
    return state ? state->boundaryVisibility 
                 : m_store.GetConfig().defaultVisibility;
}

// ============================================================================
// Workspace mutations
// ============================================================================

CommandHeader Planner::MakeHeader(WorkspaceId workspace, UserId user) {
    m_store.EnsureWorkspace(workspace);
    
    CommandHeader header;
    header.workspace = workspace;
    header.user = user;
    header.timestamp = Platform::GetTicksMs();
    return header;
}

UserState& Planner::Attach(UserId user, WorkspaceId workspace) {
    RegionId previous = EMPTY_REGION_ID;
    if (const UserState* state = m_store.FindUser(user)) {
        previous = state->selectedRegionId;
    }
    
    UserState& state = m_store.AttachUser(user, workspace);
    if (state.selectedRegionId != previous) {
        m_events.NotifyUserChanged(user, UserChangeKind::Selection);
    }
    return state;
}

ActionResult Planner::Submit(UserId user, std::unique_ptr<ICommand> cmd,
                             const char* noOpMessage) {
    ActionResult result;
    if (!cmd) {
        result.status = ActionStatus::NoOp;
        result.message = noOpMessage;
        return result;
    }
    
    std::string description = cmd->GetDescription();
    UserState& state = Attach(user, cmd->GetWorkspace());
    if (!state.history.AddCommand(std::move(cmd), m_store, m_events)) {
        result.status = ActionStatus::Rejected;
        result.message = "workspace unavailable";
        return result;
    }
    
    m_events.NotifyUserChanged(user, UserChangeKind::History);
    result.status = ActionStatus::Applied;
    result.message = description;
    return result;
}

ActionResult Planner::Reject(const char* action, const ValidationError& e) {
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s rejected: %s",
                action, e.what());
    ActionResult result;
    result.status = ActionStatus::Rejected;
    result.message = e.what();
    return result;
}

ActionResult Planner::FillRectangle(WorkspaceId workspace, UserId user,
                                    SurfaceId surface,
                                    std::optional<RegionId> region,
                                    const WorldPoint& topLeft,
                                    const WorldPoint& bottomRight) {
    try {
        auto cmd = FillCellsCommand::Create(
            m_store, MakeHeader(workspace, user), surface, region,
            topLeft, bottomRight);
        size_t count = cmd ? cmd->GetCount() : 0;
        
        ActionResult result = Submit(user, std::move(cmd), 
                                     "no cells changed");
        if (result.Applied()) {
            result.count = count;
        }
        result.regionId = NormalizeRegionId(region);
        return result;
    } catch (const ValidationError& e) {
        return Reject("Fill", e);
    }
}

ActionResult Planner::AddRegion(WorkspaceId workspace, UserId user,
                                const std::string& name, 
                                const Color& color) {
    auto cmd = AddRegionCommand::Create(
        m_store, MakeHeader(workspace, user), name, color);
    RegionId id = cmd->GetRegion().id;
    
    ActionResult result = Submit(user, std::move(cmd), "");
    if (result.Applied()) {
        result.regionId = id;
    }
    return result;
}

ActionResult Planner::EditRegion(WorkspaceId workspace, UserId user,
                                 RegionId id,
                                 const std::optional<std::string>& name,
                                 const std::optional<Color>& color) {
    try {
        auto cmd = EditRegionCommand::Create(
            m_store, MakeHeader(workspace, user), id, name, color);
        ActionResult result = Submit(user, std::move(cmd), 
                                     "region unchanged");
        result.regionId = id;
        return result;
    } catch (const ValidationError& e) {
        return Reject("Edit region", e);
    }
}

ActionResult Planner::DeleteRegion(WorkspaceId workspace, UserId user,
                                   RegionId id,
                                   std::optional<RegionId> replacement) {
    try {
        auto cmd = DeleteRegionCommand::Create(
            m_store, MakeHeader(workspace, user), id, replacement);
        ActionResult result = Submit(user, std::move(cmd), "");
        result.regionId = id;
        return result;
    } catch (const ValidationError& e) {
        return Reject("Delete region", e);
    }
}

ActionResult Planner::MoveRegion(WorkspaceId workspace, UserId user,
                                 RegionId id, int delta) {
    try {
        auto cmd = MoveRegionCommand::Create(
            m_store, MakeHeader(workspace, user), id, delta);
        ActionResult result = Submit(user, std::move(cmd), 
                                     "order unchanged");
        result.regionId = id;
        return result;
    } catch (const ValidationError& e) {
        return Reject("Move region", e);
    }
}

ActionResult Planner::SetGrid(WorkspaceId workspace, UserId user,
                              SurfaceId surface, const GridDescriptor& grid,
                              bool reproject) {
    try {
        CommandHeader header = MakeHeader(workspace, user);
        std::unique_ptr<ICommand> cmd;
        if (reproject) {
            cmd = ReprojectCommand::Create(m_store, header, surface, grid);
        } else {
            cmd = GridChangeCommand::Create(m_store, header, surface, grid);
        }
        return Submit(user, std::move(cmd), "grid unchanged");
    } catch (const ValidationError& e) {
        return Reject("Set grid", e);
    }
}

ActionResult Planner::Undo(UserId user) {
    ActionResult result;
    UserState* state = m_store.FindUser(user);
    if (!state) {
        result.message = "nothing to undo";
        return result;
    }
    
    std::string description = state->history.GetUndoDescription();
    if (!state->history.Undo(m_store, m_events)) {
        result.message = "nothing to undo";
        return result;
    }
    
    m_events.NotifyUserChanged(user, UserChangeKind::History);
    result.status = ActionStatus::Applied;
    result.message = description;
    return result;
}

ActionResult Planner::Redo(UserId user) {
    ActionResult result;
    UserState* state = m_store.FindUser(user);
    if (!state) {
        result.message = "nothing to redo";
        return result;
    }
    
    std::string description = state->history.GetRedoDescription();
    bool redone = state->history.Redo(m_store, m_events);
    
    // A discarded entry still changes what the buttons show
    m_events.NotifyUserChanged(user, UserChangeKind::History);
    if (!redone) {
        result.message = "nothing to redo";
        return result;
    }
    
    result.status = ActionStatus::Applied;
    result.message = description;
    return result;
}

// ============================================================================
// User state
// ============================================================================

ActionResult Planner::SetVisibility(UserId user, int level) {
    ActionResult result;
    UserState& state = m_store.EnsureUser(user);
    int clamped = std::clamp(level, Limits::MIN_VISIBILITY_LEVEL,
                             Limits::MAX_VISIBILITY_LEVEL);
    if (state.boundaryVisibility == clamped) {
        return result;
    }
    
    state.boundaryVisibility = clamped;
    m_events.NotifyUserChanged(user, UserChangeKind::Visibility);
    result.status = ActionStatus::Applied;
    return result;
}

ActionResult Planner::SetSelectedRegion(WorkspaceId workspace, UserId user,
                                        std::optional<RegionId> region) {
    ActionResult result;
    RegionId id = NormalizeRegionId(region);
    Model& model = m_store.EnsureWorkspace(workspace);
    if (!model.regions.Contains(id)) {
        result.status = ActionStatus::Rejected;
        result.message = "region not found";
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Select rejected: region %u not in workspace %u",
                    id, workspace);
        return result;
    }
    
    UserState& state = Attach(user, workspace);
    result.regionId = id;
    if (state.selectedRegionId == id) {
        return result;
    }
    
    state.selectedRegionId = id;
    m_events.NotifyUserChanged(user, UserChangeKind::Selection);
    result.status = ActionStatus::Applied;
    return result;
}

ActionResult Planner::SetSelectedTool(UserId user,
                                      const std::optional<std::string>& tool) {
    ActionResult result;
    UserState& state = m_store.EnsureUser(user);
    if (state.selectedTool == tool) {
        return result;
    }
    
    state.selectedTool = tool;
    m_events.NotifyUserChanged(user, UserChangeKind::Tool);
    result.status = ActionStatus::Applied;
    return result;
}

// ============================================================================
// Administrative resets
// ============================================================================

void Planner::ResetWorkspace(WorkspaceId workspace) {
    std::vector<SurfaceId> surfaces;
    if (const Model* model = m_store.FindWorkspace(workspace)) {
        for (const auto& entry : model->images) {
            surfaces.push_back(entry.first);
        }
    }
    
    m_store.ResetWorkspace(workspace);
    
    for (SurfaceId surface : surfaces) {
        m_events.NotifyCellsChanged(workspace, surface, 
                                    std::nullopt, std::nullopt);
    }
    for (const auto& entry : m_store.GetUsers()) {
        m_events.NotifyUserChanged(entry.first, UserChangeKind::History);
    }
}

void Planner::ResetSurface(WorkspaceId workspace, SurfaceId surface) {
    if (m_store.ResetSurface(workspace, surface)) {
        m_events.NotifyCellsChanged(workspace, surface, 
                                    std::nullopt, std::nullopt);
    }
}

void Planner::ResetUser(UserId user) {
    m_store.ResetUser(user);
}

void Planner::ResetAll() {
    std::vector<std::pair<WorkspaceId, SurfaceId>> surfaces;
    for (const auto& [id, model] : m_store.GetWorkspaces()) {
        for (const auto& entry : model.images) {
            surfaces.emplace_back(id, entry.first);
        }
    }
    
    m_store.ResetAll();
    
    for (const auto& [workspace, surface] : surfaces) {
        m_events.NotifyCellsChanged(workspace, surface, 
                                    std::nullopt, std::nullopt);
    }
}

} // namespace GridPlanner
