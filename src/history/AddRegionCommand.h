#pragma once

#include "ICommand.h"
#include "../RegionStore.h"
#include <memory>

namespace GridPlanner {

/**
 * Command to add a region.
 * The id is reserved when the command is created, so redo reinserts the
 * region under the same id.
 */
class AddRegionCommand : public ICommand {
public:
    AddRegionCommand(const CommandHeader& header, const Region& region);
    
    /**
     * Reserve an id in the workspace and capture the new region.
     * The workspace is created if it does not exist yet.
     */
    static std::unique_ptr<AddRegionCommand> Create(
        Store& store,
        const CommandHeader& header,
        const std::string& name,
        const Color& color
    );
    
    static std::unique_ptr<AddRegionCommand> FromJson(
        const nlohmann::json& j);
    
    bool Execute(Store& store, ChangeDispatcher& events) override;
    void Undo(Store& store, ChangeDispatcher& events) override;
    std::string GetDescription() const override;
    CommandType GetType() const override { return CommandType::RegionAdd; }
    void ToJson(nlohmann::json& out) const override;
    
    const Region& GetRegion() const { return m_region; }
    
private:
    Region m_region;
};

} // namespace GridPlanner
