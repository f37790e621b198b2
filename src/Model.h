#pragma once

#include "Types.h"
#include "Grid.h"
#include "CellMap.h"
#include "RegionStore.h"
#include <map>
#include <vector>

namespace GridPlanner {

// Cells per surface, e.g. the cells a deleted region occupied
using SurfaceCells = std::map<SurfaceId, std::vector<CellCoord>>;

// ============================================================================
// Model - complete state of one workspace
// ============================================================================

/**
 * Regions, per-surface grids and per-surface cell maps of one workspace.
 * Grids and cell maps are created lazily the first time a surface is used.
 * Only commands mutate a Model; administrative resets replace it wholesale.
 */
class Model {
public:
    explicit Model(WorkspaceId id = 0,
                   const GridDescriptor& defaultGrid = GridDescriptor());
    
    // Core data
    WorkspaceId id;
    RegionStore regions;
    std::map<SurfaceId, GridDescriptor> grids;
    std::map<SurfaceId, CellMap> images;
    GridDescriptor defaultGrid;     // Used for surfaces without a grid
    
    // Dirty tracking (set on every mutation, cleared after a snapshot)
    bool dirty = false;
    void MarkDirty();
    void ClearDirty();
    
    // Grid access
    GridDescriptor GetGrid(SurfaceId surface) const;
    void SetGrid(SurfaceId surface, const GridDescriptor& grid);
    
    // Cell map access
    CellMap& GetImage(SurfaceId surface);
    const CellMap* FindImage(SurfaceId surface) const;
    RegionId GetCell(SurfaceId surface, const CellCoord& cell) const;
    void ResetSurface(SurfaceId surface);
    
    /**
     * Every cell on every surface assigned to a region. Surfaces without
     * such cells are omitted.
     */
    SurfaceCells FindCellsWithRegion(RegionId regionId) const;
    
    /**
     * Seed the region list with a set of defaults (no history entries).
     */
    void SeedRegions(const std::vector<std::pair<std::string, Color>>& defs);
};

} // namespace GridPlanner
