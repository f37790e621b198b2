#include "MoveRegionCommand.h"
#include "CommandJson.h"
#include "../Errors.h"
#include "../Store.h"
#include "../Notifications.h"
#include <SDL3/SDL.h>

namespace GridPlanner {

MoveRegionCommand::MoveRegionCommand(
    const CommandHeader& header,
    RegionId regionId,
    const std::string& regionName,
    int delta,
    const OrderMap& oldOrders,
    const OrderMap& newOrders
) : ICommand(header), m_regionId(regionId), m_regionName(regionName),
    m_delta(delta), m_oldOrders(oldOrders), m_newOrders(newOrders) {}

std::unique_ptr<MoveRegionCommand> MoveRegionCommand::Create(
    Store& store,
    const CommandHeader& header,
    RegionId regionId,
    int delta
) {
    if (regionId == EMPTY_REGION_ID) {
        throw ValidationError(ErrorCode::ReservedRegion,
                              "cannot move reserved region");
    }
    
    Model& model = store.EnsureWorkspace(header.workspace);
    const Region* region = model.regions.Find(regionId);
    if (!region) {
        throw ValidationError(ErrorCode::RegionNotFound, "region not found");
    }
    if (delta == 0) {
        return nullptr;
    }
    
    OrderMap oldOrders = model.regions.GetOrders();
    OrderMap newOrders = model.regions.ComputeMoveOrders(regionId, delta);
    if (newOrders == oldOrders) {
        return nullptr;
    }
    
    return std::make_unique<MoveRegionCommand>(
        header, regionId, region->name, delta, oldOrders, newOrders);
}

void MoveRegionCommand::Apply(Store& store, ChangeDispatcher& events,
                              const OrderMap& orders) {
    Model* model = store.FindWorkspace(m_header.workspace);
    if (!model) {
        return;
    }
    
    int skipped = model->regions.ApplyOrders(orders);
    if (skipped > 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Move: %d regions no longer exist", skipped);
    }
    // Regions added since the capture keep their relative place
    model->regions.Normalize();
    model->MarkDirty();
    
    RegionChangeEvent event;
    event.type = RegionChangeType::OrderChanged;
    event.regionId = m_regionId;
    event.regionName = m_regionName;
    if (const Region* region = model->regions.Find(m_regionId)) {
        event.after = *region;
    }
    events.NotifyRegionsChanged(m_header.workspace, event);
}

bool MoveRegionCommand::Execute(Store& store, ChangeDispatcher& events) {
    if (!store.FindWorkspace(m_header.workspace)) {
        return false;
    }
    Apply(store, events, m_newOrders);
    return true;
}

void MoveRegionCommand::Undo(Store& store, ChangeDispatcher& events) {
    Apply(store, events, m_oldOrders);
}

std::string MoveRegionCommand::GetDescription() const {
    return "Move region '" + m_regionName + "' " + 
           (m_delta < 0 ? "up" : "down");
}

void MoveRegionCommand::ToJson(nlohmann::json& out) const {
    auto writeOrders = [](const OrderMap& orders) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& [id, order] : orders) {
            j[std::to_string(id)] = order;
        }
        return j;
    };
    out["regionId"] = m_regionId;
    out["regionName"] = m_regionName;
    out["delta"] = m_delta;
    out["before"] = writeOrders(m_oldOrders);
    out["after"] = writeOrders(m_newOrders);
}

std::unique_ptr<MoveRegionCommand> MoveRegionCommand::FromJson(
    const nlohmann::json& j
) {
    auto readOrders = [](const nlohmann::json& obj) {
        OrderMap orders;
        for (const auto& item : obj.items()) {
            std::optional<uint32_t> id = ParseIdKey(item.key());
            if (id) {
                orders[*id] = item.value().get<int>();
            }
        }
        return orders;
    };
    return std::make_unique<MoveRegionCommand>(
        HeaderFromJson(j),
        j.at("regionId").get<RegionId>(),
        j.value("regionName", ""),
        j.value("delta", 0),
        readOrders(j.at("before")),
        readOrders(j.at("after")));
}

} // namespace GridPlanner
