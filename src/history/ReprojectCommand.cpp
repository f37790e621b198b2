#include "ReprojectCommand.h"
#include "CommandJson.h"
#include "../Errors.h"
#include "../Limits.h"
#include "../Store.h"
#include "../Notifications.h"

namespace GridPlanner {

ReprojectCommand::ReprojectCommand(
    const CommandHeader& header,
    SurfaceId surface,
    const GridDescriptor& oldGrid,
    const GridDescriptor& newGrid,
    CellMap before,
    CellMap after
) : ICommand(header), m_surface(surface), m_oldGrid(oldGrid),
    m_newGrid(newGrid), m_before(std::move(before)),
    m_after(std::move(after)) {}

std::unique_ptr<ReprojectCommand> ReprojectCommand::Create(
    Store& store,
    const CommandHeader& header,
    SurfaceId surface,
    const GridDescriptor& newGrid
) {
    if (!IsValidGrid(newGrid)) {
        throw ValidationError(ErrorCode::InvalidGrid,
                              "grid size must be positive and finite");
    }
    
    Model& model = store.EnsureWorkspace(header.workspace);
    GridDescriptor oldGrid = model.GetGrid(surface);
    if (oldGrid == newGrid) {
        return nullptr;
    }
    
    CellMap before;
    if (const CellMap* image = model.FindImage(surface)) {
        before = *image;
    }
    
    size_t written = CountReprojectedCells(before, oldGrid, newGrid,
                                           Limits::MAX_CELLS_PER_SURFACE);
    if (written > Limits::MAX_CELLS_PER_SURFACE) {
        throw ValidationError(ErrorCode::ReprojectTooLarge,
                              "reprojection produces too many cells");
    }
    CellMap after = Reproject(before, oldGrid, newGrid);
    
    return std::make_unique<ReprojectCommand>(
        header, surface, oldGrid, newGrid, std::move(before), 
        std::move(after));
}

void ReprojectCommand::Apply(Store& store, ChangeDispatcher& events,
                             const GridDescriptor& grid,
                             const CellMap& cells) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model) {
        return;
    }
    model->GetImage(m_surface) = cells;
    model->SetGrid(m_surface, grid);
    
    events.NotifyGridChanged(m_header.workspace, m_surface);
    events.NotifyCellsChanged(m_header.workspace, m_surface, 
                              std::nullopt, std::nullopt);
}

bool ReprojectCommand::Execute(Store& store, ChangeDispatcher& events) {
    if (!store.FindWorkspace(m_header.workspace)) {
        return false;
    }
    Apply(store, events, m_newGrid, m_after);
    return true;
}

void ReprojectCommand::Undo(Store& store, ChangeDispatcher& events) {
    Apply(store, events, m_oldGrid, m_before);
}

std::string ReprojectCommand::GetDescription() const {
    return "Reproject grid assignments";
}

void ReprojectCommand::ToJson(nlohmann::json& out) const {
    out["surface"] = m_surface;
    out["oldGrid"] = GridToJson(m_oldGrid);
    out["newGrid"] = GridToJson(m_newGrid);
    out["before"] = CellsToJson(m_before);
    out["after"] = CellsToJson(m_after);
}

std::unique_ptr<ReprojectCommand> ReprojectCommand::FromJson(
    const nlohmann::json& j
) {
    return std::make_unique<ReprojectCommand>(
        HeaderFromJson(j),
        j.at("surface").get<SurfaceId>(),
        GridFromJson(j.at("oldGrid")),
        GridFromJson(j.at("newGrid")),
        CellsFromJson(j.at("before")),
        CellsFromJson(j.at("after")));
}

} // namespace GridPlanner
