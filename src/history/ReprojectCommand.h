#pragma once

#include "ICommand.h"
#include "../CellMap.h"
#include <memory>

namespace GridPlanner {

/**
 * Command to change the grid of one surface and resample its cells onto
 * the new grid. Keeps the complete cell map before and after.
 */
class ReprojectCommand : public ICommand {
public:
    ReprojectCommand(
        const CommandHeader& header,
        SurfaceId surface,
        const GridDescriptor& oldGrid,
        const GridDescriptor& newGrid,
        CellMap before,
        CellMap after
    );
    
    /**
     * Reproject the surface's current cells onto a new grid.
     * @return nullptr if the grid is already identical
     * @throws ValidationError for a non-positive or non-finite grid
     */
    static std::unique_ptr<ReprojectCommand> Create(
        Store& store,
        const CommandHeader& header,
        SurfaceId surface,
        const GridDescriptor& newGrid
    );
    
    static std::unique_ptr<ReprojectCommand> FromJson(
        const nlohmann::json& j);
    
    bool Execute(Store& store, ChangeDispatcher& events) override;
    void Undo(Store& store, ChangeDispatcher& events) override;
    std::string GetDescription() const override;
    CommandType GetType() const override { return CommandType::Reproject; }
    void ToJson(nlohmann::json& out) const override;
    
    const CellMap& GetBefore() const { return m_before; }
    const CellMap& GetAfter() const { return m_after; }
    
private:
    void Apply(Store& store, ChangeDispatcher& events,
               const GridDescriptor& grid, const CellMap& cells);
    
    SurfaceId m_surface;
    GridDescriptor m_oldGrid;
    GridDescriptor m_newGrid;
    CellMap m_before;
    CellMap m_after;
};

} // namespace GridPlanner
