#include "AddRegionCommand.h"
#include "CommandJson.h"
#include "../Store.h"
#include "../Notifications.h"
#include <SDL3/SDL.h>

namespace GridPlanner {

AddRegionCommand::AddRegionCommand(const CommandHeader& header,
                                   const Region& region)
    : ICommand(header), m_region(region) {}

std::unique_ptr<AddRegionCommand> AddRegionCommand::Create(
    Store& store,
    const CommandHeader& header,
    const std::string& name,
    const Color& color
) {
    Model& model = store.EnsureWorkspace(header.workspace);
    
    Region region;
    region.id = model.regions.AllocateId();
    region.name = name;
    region.color = color.Clamped();
    region.order = static_cast<int>(model.regions.NonEmptyCount()) + 1;
    model.MarkDirty();
    
    return std::make_unique<AddRegionCommand>(header, region);
}

bool AddRegionCommand::Execute(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model) {
        return false;
    }
    
    if (!model->regions.Insert(m_region)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Region %u already exists in workspace %u",
                    m_region.id, m_header.workspace);
        return false;
    }
    model->MarkDirty();
    
    RegionChangeEvent event;
    event.type = RegionChangeType::Added;
    event.regionId = m_region.id;
    event.regionName = m_region.name;
    event.after = *model->regions.Find(m_region.id);
    events.NotifyRegionsChanged(m_header.workspace, event);
    
    // The first region of an empty workspace becomes everyone's brush
    if (model->regions.NonEmptyCount() == 1) {
        for (UserState* user : store.UsersInWorkspace(m_header.workspace)) {
            if (user->selectedRegionId == EMPTY_REGION_ID) {
                user->selectedRegionId = m_region.id;
                events.NotifyUserChanged(user->id, UserChangeKind::Selection);
            }
        }
    }
    return true;
}

void AddRegionCommand::Undo(Store& store, ChangeDispatcher& events) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model || !model->regions.Contains(m_region.id)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Undo add: region %u is already gone", m_region.id);
        return;
    }
    
    // Cells painted since the add belong to later commands
    SurfaceCells cells = model->FindCellsWithRegion(m_region.id);
    for (const auto& [surface, coords] : cells) {
        CellMap& image = model->GetImage(surface);
        for (const CellCoord& cell : coords) {
            image.Erase(cell);
        }
    }
    
    RegionChangeEvent event;
    event.type = RegionChangeType::Deleted;
    event.regionId = m_region.id;
    event.regionName = m_region.name;
    event.before = *model->regions.Find(m_region.id);
    
    model->regions.Remove(m_region.id);
    model->MarkDirty();
    
    for (const auto& entry : cells) {
        events.NotifyCellsChanged(m_header.workspace, entry.first,
                                  std::nullopt, EMPTY_REGION_ID);
    }
    events.NotifyRegionsChanged(m_header.workspace, event);
    
    for (UserState* user : store.UsersInWorkspace(m_header.workspace)) {
        if (user->selectedRegionId == m_region.id) {
            user->selectedRegionId = EMPTY_REGION_ID;
            events.NotifyUserChanged(user->id, UserChangeKind::Selection);
        }
    }
}

std::string AddRegionCommand::GetDescription() const {
    return "Add region '" + m_region.name + "'";
}

void AddRegionCommand::ToJson(nlohmann::json& out) const {
    out["region"] = RegionToJson(m_region);
}

std::unique_ptr<AddRegionCommand> AddRegionCommand::FromJson(
    const nlohmann::json& j
) {
    return std::make_unique<AddRegionCommand>(
        HeaderFromJson(j), RegionFromJson(j.at("region")));
}

} // namespace GridPlanner
