#include "CellMap.h"
#include <cmath>
#include <optional>
#include <utility>

namespace GridPlanner {

RegionId CellMap::Get(const CellCoord& cell) const {
    auto it = m_cells.find(cell);
    if (it != m_cells.end()) {
        return it->second;
    }
    return EMPTY_REGION_ID;
}

void CellMap::Set(const CellCoord& cell, RegionId regionId) {
    if (regionId == EMPTY_REGION_ID) {
        m_cells.erase(cell);
    } else {
        m_cells[cell] = regionId;
    }
}

std::vector<CellCoord> CellMap::CellsWithRegion(RegionId regionId) const {
    std::vector<CellCoord> result;
    if (regionId == EMPTY_REGION_ID) {
        return result;
    }
    for (const auto& [cell, id] : m_cells) {
        if (id == regionId) {
            result.push_back(cell);
        }
    }
    return result;
}

std::vector<CellChange> CellMap::CollectChanges(const CellRange& range,
                                                RegionId target) const {
    std::vector<CellChange> changes;
    
    // Erasing a sparse map: only stored cells can change
    if (target == EMPTY_REGION_ID && 
        static_cast<long long>(m_cells.size()) < range.Count()) {
        for (const auto& [cell, id] : m_cells) {
            if (range.Contains(cell)) {
                changes.push_back({cell, id});
            }
        }
        return changes;
    }
    
    for (long long x = range.minX; x <= range.maxX; ++x) {
        for (long long y = range.minY; y <= range.maxY; ++y) {
            CellCoord cell{static_cast<int>(x), static_cast<int>(y)};
            RegionId previous = Get(cell);
            if (previous != target) {
                changes.push_back({cell, previous});
            }
        }
    }
    return changes;
}

// Inclusive index range of new-grid cells overlapping [lo, hi) on one axis.
// Empty if the range leaves the int cell space.
static std::optional<std::pair<int, int>> OverlapRange(double lo, double hi,
                                                       double offset, 
                                                       double size) {
    double first = std::floor((lo - offset) / size);
    double last = std::floor(((hi - REPROJECT_EPSILON) - offset) / size);
    if (!IsCellIndex(first) || !IsCellIndex(last)) {
        return std::nullopt;
    }
    if (last < first) {
        last = first;
    }
    return std::make_pair(static_cast<int>(first), static_cast<int>(last));
}

size_t CountReprojectedCells(const CellMap& source,
                             const GridDescriptor& oldGrid,
                             const GridDescriptor& newGrid,
                             size_t limit) {
    size_t total = 0;
    for (const auto& entry : source.Cells()) {
        CellBounds footprint = BoundsOf(oldGrid, entry.first.x, 
                                        entry.first.y);
        auto xs = OverlapRange(footprint.topLeft.x, footprint.bottomRight.x,
                               newGrid.xOffset, newGrid.width);
        auto ys = OverlapRange(footprint.topLeft.y, footprint.bottomRight.y,
                               newGrid.yOffset, newGrid.height);
        if (!xs || !ys) {
            return limit + 1;
        }
        
        long long span = (static_cast<long long>(xs->second) - xs->first + 1) *
                         (static_cast<long long>(ys->second) - ys->first + 1);
        if (static_cast<unsigned long long>(span) > limit - total) {
            return limit + 1;
        }
        total += static_cast<size_t>(span);
    }
    return total;
}

CellMap Reproject(const CellMap& source,
                  const GridDescriptor& oldGrid,
                  const GridDescriptor& newGrid) {
    CellMap result;
    for (const auto& [cell, regionId] : source.Cells()) {
        CellBounds footprint = BoundsOf(oldGrid, cell.x, cell.y);
        
        auto xs = OverlapRange(footprint.topLeft.x, footprint.bottomRight.x,
                               newGrid.xOffset, newGrid.width);
        auto ys = OverlapRange(footprint.topLeft.y, footprint.bottomRight.y,
                               newGrid.yOffset, newGrid.height);
        if (!xs || !ys) {
            continue;   // Off the addressable grid
        }
        
        for (long long nx = xs->first; nx <= xs->second; ++nx) {
            for (long long ny = ys->first; ny <= ys->second; ++ny) {
                result.Set({static_cast<int>(nx), static_cast<int>(ny)}, 
                           regionId);
            }
        }
    }
    return result;
}

} // namespace GridPlanner
