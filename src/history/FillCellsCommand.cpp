#include "FillCellsCommand.h"
#include "CommandJson.h"
#include "../Errors.h"
#include "../Limits.h"
#include "../Store.h"
#include "../Notifications.h"
#include <SDL3/SDL.h>

namespace GridPlanner {

FillCellsCommand::FillCellsCommand(
    const CommandHeader& header,
    SurfaceId surface,
    RegionId regionId,
    const std::string& regionName,
    const std::vector<CellChange>& changes
) : ICommand(header), m_surface(surface), m_regionId(regionId),
    m_regionName(regionName), m_changes(changes) {}

std::unique_ptr<FillCellsCommand> FillCellsCommand::Create(
    Store& store,
    const CommandHeader& header,
    SurfaceId surface,
    std::optional<RegionId> regionId,
    const WorldPoint& topLeft,
    const WorldPoint& bottomRight
) {
    Model& model = store.EnsureWorkspace(header.workspace);
    
    RegionId target = NormalizeRegionId(regionId);
    const Region* region = model.regions.Find(target);
    if (!region) {
        throw ValidationError(ErrorCode::RegionNotFound, "region not found");
    }
    
    std::optional<CellRange> range = CellRangeOf(model.GetGrid(surface), 
                                                 topLeft, bottomRight);
    if (!range) {
        throw ValidationError(ErrorCode::OutOfRange,
                              "rectangle lies outside the grid");
    }
    if (range->Count() > Limits::MAX_FILL_CELLS) {
        throw ValidationError(ErrorCode::FillTooLarge,
                              "rectangle covers too many cells");
    }
    
    std::vector<CellChange> changes;
    if (const CellMap* image = model.FindImage(surface)) {
        changes = image->CollectChanges(*range, target);
    } else {
        changes = CellMap().CollectChanges(*range, target);
    }
    if (changes.empty()) {
        return nullptr;
    }
    
    return std::make_unique<FillCellsCommand>(
        header, surface, target, region->name, changes);
}

std::vector<CellCoord> FillCellsCommand::ChangedCells() const {
    std::vector<CellCoord> cells;
    cells.reserve(m_changes.size());
    for (const auto& change : m_changes) {
        cells.push_back(change.cell);
    }
    return cells;
}

bool FillCellsCommand::Execute(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model) {
        return false;
    }
    
    if (!model->regions.Contains(m_regionId)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Fill: region %u is gone, nothing painted", m_regionId);
        m_applied = false;
        return true;
    }
    m_applied = true;
    
    CellMap& image = model->GetImage(m_surface);
    for (const auto& change : m_changes) {
        image.Set(change.cell, m_regionId);
    }
    model->MarkDirty();
    
    events.NotifyCellsChanged(m_header.workspace, m_surface, 
                              ChangedCells(), m_regionId);
    return true;
}

void FillCellsCommand::Undo(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model || !m_applied) {
        return;
    }
    
    // Regions deleted since the fill leave their cells unassigned
    size_t dropped = 0;
    CellMap& image = model->GetImage(m_surface);
    for (const auto& change : m_changes) {
        RegionId previous = change.previous;
        if (!model->regions.Contains(previous)) {
            previous = EMPTY_REGION_ID;
            ++dropped;
        }
        image.Set(change.cell, previous);
    }
    model->MarkDirty();
    if (dropped > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Undo fill: %zu cells of deleted regions left empty",
                    dropped);
    }
    
    // Restored cells hold mixed regions
    events.NotifyCellsChanged(m_header.workspace, m_surface, 
                              ChangedCells(), std::nullopt);
}

std::string FillCellsCommand::GetDescription() const {
    if (m_regionId == EMPTY_REGION_ID) {
        return "Erase rectangle";
    }
    return "Fill rectangle with '" + m_regionName + "'";
}

void FillCellsCommand::ToJson(nlohmann::json& out) const {
    out["surface"] = m_surface;
    out["regionId"] = m_regionId;
    out["regionName"] = m_regionName;
    
    // [x, y, previous] triples keep large fills compact
    nlohmann::json changes = nlohmann::json::array();
    for (const auto& change : m_changes) {
        changes.push_back({change.cell.x, change.cell.y, change.previous});
    }
    out["changes"] = changes;
    out["applied"] = m_applied;
}

std::unique_ptr<FillCellsCommand> FillCellsCommand::FromJson(
    const nlohmann::json& j
) {
    std::vector<CellChange> changes;
    for (const auto& entry : j.at("changes")) {
        CellChange change;
        change.cell.x = entry.at(0).get<int>();
        change.cell.y = entry.at(1).get<int>();
        change.previous = entry.at(2).get<RegionId>();
        changes.push_back(change);
    }
    auto cmd = std::make_unique<FillCellsCommand>(
        HeaderFromJson(j),
        j.at("surface").get<SurfaceId>(),
        j.value("regionId", EMPTY_REGION_ID),
        j.value("regionName", ""),
        changes);
    cmd->m_applied = j.value("applied", true);
    return cmd;
}

} // namespace GridPlanner
