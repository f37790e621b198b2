#pragma once

#include "ICommand.h"
#include "../Grid.h"
#include <memory>

namespace GridPlanner {

/**
 * Command to change the grid of one surface without touching its cells.
 */
class GridChangeCommand : public ICommand {
public:
    GridChangeCommand(
        const CommandHeader& header,
        SurfaceId surface,
        const GridDescriptor& oldGrid,
        const GridDescriptor& newGrid
    );
    
    /**
     * @return nullptr if the grid is already identical
     * @throws ValidationError for a non-positive or non-finite grid
     */
    static std::unique_ptr<GridChangeCommand> Create(
        Store& store,
        const CommandHeader& header,
        SurfaceId surface,
        const GridDescriptor& newGrid
    );
    
    static std::unique_ptr<GridChangeCommand> FromJson(
        const nlohmann::json& j);
    
    bool Execute(Store& store, ChangeDispatcher& events) override;
    void Undo(Store& store, ChangeDispatcher& events) override;
    std::string GetDescription() const override;
    CommandType GetType() const override { return CommandType::GridChange; }
    void ToJson(nlohmann::json& out) const override;
    
private:
    SurfaceId m_surface;
    GridDescriptor m_oldGrid;
    GridDescriptor m_newGrid;
};

} // namespace GridPlanner
