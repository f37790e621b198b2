#include "DeleteRegionCommand.h"
#include "CommandJson.h"
#include "../Errors.h"
#include "../Store.h"
#include "../Notifications.h"
#include <SDL3/SDL.h>

namespace GridPlanner {

DeleteRegionCommand::DeleteRegionCommand(
    const CommandHeader& header,
    const Region& region,
    RegionId replacementId,
    const std::string& replacementName
) : ICommand(header), m_region(region), m_replacementId(replacementId),
    m_replacementName(replacementName) {}

std::unique_ptr<DeleteRegionCommand> DeleteRegionCommand::Create(
    Store& store,
    const CommandHeader& header,
    RegionId regionId,
    std::optional<RegionId> replacementId
) {
    if (regionId == EMPTY_REGION_ID) {
        throw ValidationError(ErrorCode::ReservedRegion,
                              "cannot delete reserved region");
    }
    
    Model& model = store.EnsureWorkspace(header.workspace);
    const Region* region = model.regions.Find(regionId);
    if (!region) {
        throw ValidationError(ErrorCode::RegionNotFound, "region not found");
    }
    
    RegionId replacement = NormalizeRegionId(replacementId);
    if (replacement == regionId) {
        throw ValidationError(ErrorCode::ReplacementNotFound,
                              "region cannot replace itself");
    }
    const Region* target = model.regions.Find(replacement);
    if (!target) {
        throw ValidationError(ErrorCode::ReplacementNotFound,
                              "replacement region not found");
    }
    
    return std::make_unique<DeleteRegionCommand>(
        header, *region, replacement, target->name);
}

bool DeleteRegionCommand::Execute(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model) {
        return false;
    }
    if (!model->regions.Contains(m_region.id)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Delete: region %u is already gone", m_region.id);
        m_cells.clear();
        m_reselectedUsers.clear();
        m_removed = false;
        return true;
    }
    
    m_removed = true;
    m_appliedReplacement = m_replacementId;
    if (!model->regions.Contains(m_appliedReplacement)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Delete: replacement %u is gone, erasing instead",
                    m_appliedReplacement);
        m_appliedReplacement = EMPTY_REGION_ID;
    }
    
    // Capture the region as it is now (order may have moved since Create)
    m_region = *model->regions.Find(m_region.id);
    
    m_cells = model->FindCellsWithRegion(m_region.id);
    for (const auto& [surface, coords] : m_cells) {
        CellMap& image = model->GetImage(surface);
        for (const CellCoord& cell : coords) {
            image.Set(cell, m_appliedReplacement);
        }
    }
    
    model->regions.Remove(m_region.id);
    model->MarkDirty();
    
    for (const auto& entry : m_cells) {
        events.NotifyCellsChanged(m_header.workspace, entry.first,
                                  std::nullopt, m_appliedReplacement);
    }
    
    RegionChangeEvent event;
    event.type = RegionChangeType::Deleted;
    event.regionId = m_region.id;
    event.regionName = m_region.name;
    event.before = m_region;
    events.NotifyRegionsChanged(m_header.workspace, event);
    
    m_reselectedUsers.clear();
    for (UserState* user : store.UsersInWorkspace(m_header.workspace)) {
        if (user->selectedRegionId == m_region.id) {
            user->selectedRegionId = m_appliedReplacement;
            m_reselectedUsers.push_back(user->id);
            events.NotifyUserChanged(user->id, UserChangeKind::Selection);
        }
    }
    return true;
}

void DeleteRegionCommand::Undo(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model || !m_removed) {
        return;
    }
    if (!model->regions.Insert(m_region)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Undo delete: region %u already present", m_region.id);
        return;
    }
    
    for (const auto& [surface, coords] : m_cells) {
        CellMap& image = model->GetImage(surface);
        for (const CellCoord& cell : coords) {
            image.Set(cell, m_region.id);
        }
    }
    model->MarkDirty();
    
    RegionChangeEvent event;
    event.type = RegionChangeType::Added;
    event.regionId = m_region.id;
    event.regionName = m_region.name;
    event.after = *model->regions.Find(m_region.id);
    events.NotifyRegionsChanged(m_header.workspace, event);
    
    for (const auto& entry : m_cells) {
        events.NotifyCellsChanged(m_header.workspace, entry.first,
                                  std::nullopt, m_region.id);
    }
    
    for (UserId id : m_reselectedUsers) {
        UserState* user = store.FindUser(id);
        if (user && user->workspace == m_header.workspace &&
            user->selectedRegionId == m_appliedReplacement) {
            user->selectedRegionId = m_region.id;
            events.NotifyUserChanged(user->id, UserChangeKind::Selection);
        }
    }
}

std::string DeleteRegionCommand::GetDescription() const {
    return "Delete region '" + m_region.name + "' -> " + m_replacementName;
}

void DeleteRegionCommand::ToJson(nlohmann::json& out) const {
    out["region"] = RegionToJson(m_region);
    out["replacementId"] = m_replacementId;
    out["replacementName"] = m_replacementName;
    out["appliedReplacement"] = m_appliedReplacement;
    
    nlohmann::json cells = nlohmann::json::object();
    for (const auto& [surface, coords] : m_cells) {
        nlohmann::json keys = nlohmann::json::array();
        for (const CellCoord& cell : coords) {
            keys.push_back(CellKey(cell));
        }
        cells[std::to_string(surface)] = keys;
    }
    out["cells"] = cells;
    out["reselectedUsers"] = m_reselectedUsers;
    out["removed"] = m_removed;
}

std::unique_ptr<DeleteRegionCommand> DeleteRegionCommand::FromJson(
    const nlohmann::json& j
) {
    auto cmd = std::make_unique<DeleteRegionCommand>(
        HeaderFromJson(j),
        RegionFromJson(j.at("region")),
        j.value("replacementId", EMPTY_REGION_ID),
        j.value("replacementName", std::string(RegionStore::EMPTY_REGION_NAME)));
    cmd->m_appliedReplacement = 
        j.value("appliedReplacement", cmd->m_replacementId);
    
    if (j.contains("cells") && j["cells"].is_object()) {
        for (const auto& item : j["cells"].items()) {
            std::optional<uint32_t> surface = ParseIdKey(item.key());
            if (!surface) {
                continue;
            }
            std::vector<CellCoord>& coords = cmd->m_cells[*surface];
            for (const auto& k : item.value()) {
                std::optional<CellCoord> cell =
                    ParseCellKey(k.get<std::string>());
                if (cell) {
                    coords.push_back(*cell);
                }
            }
        }
    }
    cmd->m_removed = j.value("removed", true);
    if (j.contains("reselectedUsers")) {
        cmd->m_reselectedUsers =
            j["reselectedUsers"].get<std::vector<UserId>>();
    }
    return cmd;
}

} // namespace GridPlanner
