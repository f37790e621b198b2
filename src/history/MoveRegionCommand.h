#pragma once

#include "ICommand.h"
#include "../RegionStore.h"
#include <memory>

namespace GridPlanner {

/**
 * Command to move a region up (delta < 0) or down (delta > 0) in the
 * display order. Stores the complete order map before and after.
 */
class MoveRegionCommand : public ICommand {
public:
    MoveRegionCommand(
        const CommandHeader& header,
        RegionId regionId,
        const std::string& regionName,
        int delta,
        const OrderMap& oldOrders,
        const OrderMap& newOrders
    );
    
    /**
     * @return nullptr if delta is 0 or no order would change
     * @throws ValidationError for the Empty region or an unknown id
     */
    static std::unique_ptr<MoveRegionCommand> Create(
        Store& store,
        const CommandHeader& header,
        RegionId regionId,
        int delta
    );
    
    static std::unique_ptr<MoveRegionCommand> FromJson(
        const nlohmann::json& j);
    
    bool Execute(Store& store, ChangeDispatcher& events) override;
    void Undo(Store& store, ChangeDispatcher& events) override;
    std::string GetDescription() const override;
    CommandType GetType() const override { return CommandType::RegionMove; }
    void ToJson(nlohmann::json& out) const override;
    
private:
    void Apply(Store& store, ChangeDispatcher& events, const OrderMap& orders);
    
    RegionId m_regionId;
    std::string m_regionName;
    int m_delta;
    OrderMap m_oldOrders;
    OrderMap m_newOrders;
};

} // namespace GridPlanner
