#pragma once

#include "ICommand.h"
#include "RegionPropertiesSnapshot.h"
#include <memory>

namespace GridPlanner {

/**
 * Command to change a region's name and/or color.
 */
class EditRegionCommand : public ICommand {
public:
    EditRegionCommand(
        const CommandHeader& header,
        RegionId regionId,
        const RegionPropertiesSnapshot& oldProps,
        const RegionPropertiesSnapshot& newProps
    );
    
    /**
     * Capture an edit. Absent fields keep their current value.
     * @return nullptr if nothing would change
     * @throws ValidationError for the Empty region or an unknown id
     */
    static std::unique_ptr<EditRegionCommand> Create(
        Store& store,
        const CommandHeader& header,
        RegionId regionId,
        const std::optional<std::string>& name,
        const std::optional<Color>& color
    );
    
    static std::unique_ptr<EditRegionCommand> FromJson(
        const nlohmann::json& j);
    
    bool Execute(Store& store, ChangeDispatcher& events) override;
    void Undo(Store& store, ChangeDispatcher& events) override;
    std::string GetDescription() const override;
    CommandType GetType() const override { return CommandType::RegionEdit; }
    void ToJson(nlohmann::json& out) const override;
    
private:
    bool Apply(Store& store, ChangeDispatcher& events,
               const RegionPropertiesSnapshot& from,
               const RegionPropertiesSnapshot& to);
    
    RegionId m_regionId;
    RegionPropertiesSnapshot m_oldProps;
    RegionPropertiesSnapshot m_newProps;
};

} // namespace GridPlanner
