#pragma once

#include "ICommand.h"
#include "../CellMap.h"
#include <memory>
#include <vector>

namespace GridPlanner {

/**
 * Command to fill (or erase) a rectangle of cells on one surface.
 * Only cells whose value actually changes are recorded, each with its
 * previous value.
 */
class FillCellsCommand : public ICommand {
public:
    FillCellsCommand(
        const CommandHeader& header,
        SurfaceId surface,
        RegionId regionId,
        const std::string& regionName,
        const std::vector<CellChange>& changes
    );
    
    /**
     * Capture a fill of the world rectangle spanned by two corners.
     * An absent or Empty region erases.
     * @return nullptr if no cell would change
     * @throws ValidationError for an unknown region, a corner outside the
     *         int cell space, or a rectangle larger than
     *         Limits::MAX_FILL_CELLS
     */
    static std::unique_ptr<FillCellsCommand> Create(
        Store& store,
        const CommandHeader& header,
        SurfaceId surface,
        std::optional<RegionId> regionId,
        const WorldPoint& topLeft,
        const WorldPoint& bottomRight
    );
    
    static std::unique_ptr<FillCellsCommand> FromJson(
        const nlohmann::json& j);
    
    bool Execute(Store& store, ChangeDispatcher& events) override;
    void Undo(Store& store, ChangeDispatcher& events) override;
    std::string GetDescription() const override;
    CommandType GetType() const override { return CommandType::FillCells; }
    void ToJson(nlohmann::json& out) const override;
    
    size_t GetCount() const { return m_changes.size(); }
    
private:
    std::vector<CellCoord> ChangedCells() const;
    
    SurfaceId m_surface;
    RegionId m_regionId;
    std::string m_regionName;
    std::vector<CellChange> m_changes;
    bool m_applied = true;          // False if the region was gone at execute
};

} // namespace GridPlanner
