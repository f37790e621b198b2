#include "GridChangeCommand.h"
#include "CommandJson.h"
#include "../Errors.h"
#include "../Store.h"
#include "../Notifications.h"

namespace GridPlanner {

GridChangeCommand::GridChangeCommand(
    const CommandHeader& header,
    SurfaceId surface,
    const GridDescriptor& oldGrid,
    const GridDescriptor& newGrid
) : ICommand(header), m_surface(surface), m_oldGrid(oldGrid),
    m_newGrid(newGrid) {}

std::unique_ptr<GridChangeCommand> GridChangeCommand::Create(
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
    return std::make_unique<GridChangeCommand>(
        header, surface, oldGrid, newGrid);
}

bool GridChangeCommand::Execute(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model) {
        return false;
    }
    model->SetGrid(m_surface, m_newGrid);
    events.NotifyGridChanged(m_header.workspace, m_surface);
    return true;
}

void GridChangeCommand::Undo(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model) {
        return;
    }
    model->SetGrid(m_surface, m_oldGrid);
    events.NotifyGridChanged(m_header.workspace, m_surface);
}

std::string GridChangeCommand::GetDescription() const {
    return "Update grid properties";
}

void GridChangeCommand::ToJson(nlohmann::json& out) const {
    out["surface"] = m_surface;
    out["before"] = GridToJson(m_oldGrid);
    out["after"] = GridToJson(m_newGrid);
}

std::unique_ptr<GridChangeCommand> GridChangeCommand::FromJson(
    const nlohmann::json& j
) {
    return std::make_unique<GridChangeCommand>(
        HeaderFromJson(j),
        j.at("surface").get<SurfaceId>(),
        GridFromJson(j.at("before")),
        GridFromJson(j.at("after")));
}

} // namespace GridPlanner
