#pragma once

#include "Types.h"
#include "Grid.h"
#include <unordered_map>
#include <vector>

namespace GridPlanner {

/**
 * One cell touched by a fill, with the value it held before.
 * EMPTY_REGION_ID as the previous value means the cell was unassigned.
 */
struct CellChange {
    CellCoord cell;
    RegionId previous = EMPTY_REGION_ID;
};

/**
 * Sparse cell -> region assignment for one (workspace, surface).
 * Only non-empty ids are stored: writing the Empty id erases the cell, so
 * absence is the single representation of "unassigned".
 */
class CellMap {
public:
    using Storage = std::unordered_map<CellCoord, RegionId, CellCoordHash>;
    
    /**
     * Region at a cell, EMPTY_REGION_ID when unassigned.
     */
    RegionId Get(const CellCoord& cell) const;
    
    /**
     * Assign a cell. EMPTY_REGION_ID erases it.
     */
    void Set(const CellCoord& cell, RegionId regionId);
    
    void Erase(const CellCoord& cell) { m_cells.erase(cell); }
    void Clear() { m_cells.clear(); }
    
    size_t Size() const { return m_cells.size(); }
    bool Empty() const { return m_cells.empty(); }
    
    const Storage& Cells() const { return m_cells; }
    
    /**
     * Every cell currently assigned to a region.
     */
    std::vector<CellCoord> CellsWithRegion(RegionId regionId) const;
    
    /**
     * Cells in an inclusive range whose value differs from the target,
     * with their prior values. Nothing is written.
     */
    std::vector<CellChange> CollectChanges(const CellRange& range,
                                           RegionId target) const;
    
    bool operator==(const CellMap& other) const {
        return m_cells == other.m_cells;
    }
    
    bool operator!=(const CellMap& other) const {
        return !(*this == other);
    }
    
private:
    Storage m_cells;
};

/**
 * Resample a cell map from one grid onto another.
 * Every new cell whose footprint intersects an old assigned cell's footprint
 * receives that cell's region. Where several old cells land on the same new
 * cell the last one written wins; which one that is is unspecified.
 */
CellMap Reproject(const CellMap& source,
                  const GridDescriptor& oldGrid,
                  const GridDescriptor& newGrid);

/**
 * Number of cell writes Reproject would make (an upper bound on the size
 * of its result). Stops counting once the total passes limit and returns
 * limit + 1; a footprint that leaves the int cell space also counts as
 * over the limit.
 */
size_t CountReprojectedCells(const CellMap& source,
                             const GridDescriptor& oldGrid,
                             const GridDescriptor& newGrid,
                             size_t limit);

} // namespace GridPlanner
