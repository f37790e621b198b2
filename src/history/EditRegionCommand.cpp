#include "EditRegionCommand.h"
#include "CommandJson.h"
#include "../Errors.h"
#include "../Store.h"
#include "../Notifications.h"
#include <SDL3/SDL.h>

namespace GridPlanner {

EditRegionCommand::EditRegionCommand(
    const CommandHeader& header,
    RegionId regionId,
    const RegionPropertiesSnapshot& oldProps,
    const RegionPropertiesSnapshot& newProps
) : ICommand(header), m_regionId(regionId), m_oldProps(oldProps),
    m_newProps(newProps) {}

std::unique_ptr<EditRegionCommand> EditRegionCommand::Create(
    Store& store,
    const CommandHeader& header,
    RegionId regionId,
    const std::optional<std::string>& name,
    const std::optional<Color>& color
) {
    if (regionId == EMPTY_REGION_ID) {
        throw ValidationError(ErrorCode::ReservedRegion,
                              "cannot edit reserved region");
    }
    
    Model& model = store.EnsureWorkspace(header.workspace);
    const Region* region = model.regions.Find(regionId);
    if (!region) {
        throw ValidationError(ErrorCode::RegionNotFound, "region not found");
    }
    
    RegionPropertiesSnapshot oldProps{region->name, region->color};
    RegionPropertiesSnapshot newProps = oldProps;
    if (name) {
        newProps.name = *name;
    }
    if (color) {
        newProps.color = color->Clamped();
    }
    
    if (newProps == oldProps) {
        return nullptr;
    }
    return std::make_unique<EditRegionCommand>(
        header, regionId, oldProps, newProps);
}

bool EditRegionCommand::Apply(Store& store, ChangeDispatcher& events,
                              const RegionPropertiesSnapshot& from,
                              const RegionPropertiesSnapshot& to) {
    Model* model = store.FindWorkspace(m_header.workspace);
    Region* region = model ? model->regions.Find(m_regionId) : nullptr;
    if (!region) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Edit: region %u not found in workspace %u",
                    m_regionId, m_header.workspace);
        return false;
    }
    
    RegionChangeEvent event;
    event.type = from.color != to.color ? RegionChangeType::Modified
                                        : RegionChangeType::NameModified;
    event.regionId = m_regionId;
    event.before = *region;
    
    region->name = to.name;
    region->color = to.color;
    model->MarkDirty();
    
    event.regionName = region->name;
    event.after = *region;
    events.NotifyRegionsChanged(m_header.workspace, event);
    return true;
}

bool EditRegionCommand::Execute(Store& store, ChangeDispatcher& events) {
    if (!store.FindWorkspace(m_header.workspace)) {
        return false;
    }
    // A region deleted by another user is skipped, not fatal
    Apply(store, events, m_oldProps, m_newProps);
    return true;
}

void EditRegionCommand::Undo(Store& store, ChangeDispatcher& events) {
    Apply(store, events, m_newProps, m_oldProps);
}

std::string EditRegionCommand::GetDescription() const {
    return "Edit region '" + m_newProps.name + "'";
}

void EditRegionCommand::ToJson(nlohmann::json& out) const {
    out["regionId"] = m_regionId;
    out["before"] = {
        {"name", m_oldProps.name},
        {"color", m_oldProps.color.ToHex()}
    };
    out["after"] = {
        {"name", m_newProps.name},
        {"color", m_newProps.color.ToHex()}
    };
}

std::unique_ptr<EditRegionCommand> EditRegionCommand::FromJson(
    const nlohmann::json& j
) {
    auto readProps = [](const nlohmann::json& p) {
        RegionPropertiesSnapshot props;
        props.name = p.value("name", "");
        props.color = Color::FromHex(p.value("color", "#000000ff"));
        return props;
    };
    return std::make_unique<EditRegionCommand>(
        HeaderFromJson(j),
        j.at("regionId").get<RegionId>(),
        readProps(j.at("before")),
        readProps(j.at("after")));
}

} // namespace GridPlanner
