#pragma once

#include "Types.h"
#include "Color.h"
#include <map>
#include <string>
#include <vector>

namespace GridPlanner {

// ============================================================================
// Regions
// ============================================================================

struct Region {
    RegionId id = EMPTY_REGION_ID;
    std::string name;
    Color color;
    int order = 0;      // Dense 1..N among non-empty regions, 0 for Empty
};

// Region id -> display order
using OrderMap = std::map<RegionId, int>;

/**
 * Named, colored, ordered regions of one workspace.
 * Always contains the Empty region (id 0). Ids are allocated monotonically
 * and never handed out twice, even after the region is removed.
 */
class RegionStore {
public:
    static const char* const EMPTY_REGION_NAME;
    
    RegionStore();
    
    /**
     * Create a region with the next id and place it last.
     * @return Copy of the stored region
     */
    Region Add(const std::string& name, const Color& color);
    
    /**
     * Reserve the next id without inserting anything.
     */
    RegionId AllocateId();
    
    /**
     * Insert a previously captured region at its captured order, shifting
     * regions at or after that order down by one. Raises the id high-water
     * mark when needed.
     * @return false if the id is Empty or already present
     */
    bool Insert(const Region& region);
    
    /**
     * Remove a non-empty region and renormalize orders.
     * @return false if the id is Empty or unknown
     */
    bool Remove(RegionId id);
    
    // Non-owning pointers, valid until regions are added or removed
    Region* Find(RegionId id);
    const Region* Find(RegionId id) const;
    bool Contains(RegionId id) const;
    
    /**
     * All regions sorted by order (Empty first when included).
     */
    std::vector<Region> GetOrdered(bool includeEmpty = true) const;
    
    size_t NonEmptyCount() const;
    
    /**
     * Current order of every non-empty region.
     */
    OrderMap GetOrders() const;
    
    /**
     * Assign orders from a captured map. Ids no longer present are skipped.
     * @return Number of ids that were skipped
     */
    int ApplyOrders(const OrderMap& orders);
    
    /**
     * Orders after moving a region by delta positions, without applying
     * them. The target is nudged to order + delta +/- 0.5, every non-empty
     * region is re-sorted (ties broken by id) and dense orders reassigned.
     */
    OrderMap ComputeMoveOrders(RegionId id, int delta) const;
    
    /**
     * Reassign dense orders 1..N preserving the current relative order.
     */
    void Normalize();
    
    RegionId NextId() const { return m_nextId; }
    void SetNextId(RegionId nextId);
    
    /**
     * Drop every non-empty region and restart ids at 1.
     */
    void Clear();
    
private:
    std::map<RegionId, Region> m_regions;
    RegionId m_nextId;
};

} // namespace GridPlanner
