#pragma once

#include "ICommand.h"
#include "../Model.h"
#include <memory>
#include <vector>

namespace GridPlanner {

/**
 * Command to delete a region.
 * Every cell of the region (on every surface) is reassigned to the
 * replacement region, or erased when the replacement is Empty. Saves the
 * region, its cells and the users whose selection moved, for undo.
 */
class DeleteRegionCommand : public ICommand {
public:
    DeleteRegionCommand(
        const CommandHeader& header,
        const Region& region,
        RegionId replacementId,
        const std::string& replacementName
    );
    
    /**
     * @throws ValidationError for the Empty region, an unknown region, or
     *         a replacement that is unknown or the region itself
     */
    static std::unique_ptr<DeleteRegionCommand> Create(
        Store& store,
        const CommandHeader& header,
        RegionId regionId,
        std::optional<RegionId> replacementId
    );
    
    static std::unique_ptr<DeleteRegionCommand> FromJson(
        const nlohmann::json& j);
    
    bool Execute(Store& store, ChangeDispatcher& events) override;
    void Undo(Store& store, ChangeDispatcher& events) override;
    std::string GetDescription() const override;
    CommandType GetType() const override { return CommandType::RegionDelete; }
    void ToJson(nlohmann::json& out) const override;
    
    // Cells the last Execute reassigned
    const SurfaceCells& GetRemappedCells() const { return m_cells; }
    
private:
    Region m_region;
    RegionId m_replacementId;
    std::string m_replacementName;
    
    // Captured by Execute
    RegionId m_appliedReplacement = EMPTY_REGION_ID;
    SurfaceCells m_cells;
    std::vector<UserId> m_reselectedUsers;
    bool m_removed = true;          // False if the region was already gone
};

} // namespace GridPlanner
