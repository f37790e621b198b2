#include "RegionStore.h"
#include <algorithm>

namespace GridPlanner {

const char* const RegionStore::EMPTY_REGION_NAME = "(Empty)";

// Non-empty regions sorted by (order, id)
template <typename RegionPtr, typename Map>
static std::vector<RegionPtr> SortedNonEmpty(Map& regions) {
    std::vector<RegionPtr> sorted;
    sorted.reserve(regions.size());
    for (auto& [id, region] : regions) {
        if (id != EMPTY_REGION_ID) {
            sorted.push_back(&region);
        }
    }
    std::sort(sorted.begin(), sorted.end(),
        [](RegionPtr a, RegionPtr b) {
            if (a->order != b->order) return a->order < b->order;
            return a->id < b->id;
        });
    return sorted;
}

RegionStore::RegionStore()
    : m_nextId(1)
{
    Clear();
}

void RegionStore::Clear() {
    m_regions.clear();
    
    Region empty;
    empty.id = EMPTY_REGION_ID;
    empty.name = EMPTY_REGION_NAME;
    empty.color = Color(0, 0, 0, 0);
    empty.order = 0;
    m_regions[EMPTY_REGION_ID] = empty;
    
    m_nextId = 1;
}

RegionId RegionStore::AllocateId() {
    return m_nextId++;
}

Region RegionStore::Add(const std::string& name, const Color& color) {
    Region region;
    region.id = AllocateId();
    region.name = name;
    region.color = color.Clamped();
    region.order = static_cast<int>(region.id);
    Insert(region);
    return *Find(region.id);
}

bool RegionStore::Insert(const Region& region) {
    if (region.id == EMPTY_REGION_ID || Contains(region.id)) {
        return false;
    }
    
    if (region.order > 0) {
        for (auto& [id, existing] : m_regions) {
            if (id != EMPTY_REGION_ID && existing.order >= region.order) {
                existing.order += 1;
            }
        }
    }
    
    Region inserted = region;
    if (inserted.order <= 0) {
        // No usable position: append
        inserted.order = static_cast<int>(NonEmptyCount()) + 1;
    }
    m_regions[inserted.id] = inserted;
    
    if (inserted.id >= m_nextId) {
        m_nextId = inserted.id + 1;
    }
    
    Normalize();
    return true;
}

bool RegionStore::Remove(RegionId id) {
    if (id == EMPTY_REGION_ID) {
        return false;
    }
    if (m_regions.erase(id) == 0) {
        return false;
    }
    Normalize();
    return true;
}

Region* RegionStore::Find(RegionId id) {
    auto it = m_regions.find(id);
    return it != m_regions.end() ? &it->second : nullptr;
}

const Region* RegionStore::Find(RegionId id) const {
    auto it = m_regions.find(id);
    return it != m_regions.end() ? &it->second : nullptr;
}

bool RegionStore::Contains(RegionId id) const {
    return m_regions.count(id) > 0;
}

std::vector<Region> RegionStore::GetOrdered(bool includeEmpty) const {
    std::vector<Region> result;
    result.reserve(m_regions.size());
    if (includeEmpty) {
        result.push_back(m_regions.at(EMPTY_REGION_ID));
    }
    for (const Region* region : SortedNonEmpty<const Region*>(m_regions)) {
        result.push_back(*region);
    }
    return result;
}

size_t RegionStore::NonEmptyCount() const {
    return m_regions.size() - 1;
}

OrderMap RegionStore::GetOrders() const {
    OrderMap orders;
    for (const auto& [id, region] : m_regions) {
        if (id != EMPTY_REGION_ID) {
            orders[id] = region.order;
        }
    }
    return orders;
}

int RegionStore::ApplyOrders(const OrderMap& orders) {
    int skipped = 0;
    for (const auto& [id, order] : orders) {
        Region* region = Find(id);
        if (!region || id == EMPTY_REGION_ID) {
            ++skipped;
            continue;
        }
        region->order = order;
    }
    return skipped;
}

OrderMap RegionStore::ComputeMoveOrders(RegionId id, int delta) const {
    // Work on (id, fractional order) pairs so the live store stays intact
    std::vector<std::pair<RegionId, double>> ranked;
    int rank = 1;
    for (const Region* region : SortedNonEmpty<const Region*>(m_regions)) {
        ranked.emplace_back(region->id, static_cast<double>(rank++));
    }
    
    for (auto& [rid, order] : ranked) {
        if (rid != id || delta == 0) continue;
        order += delta > 0 ? delta + 0.5 : delta - 0.5;
    }
    
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second < b.second;
            return a.first < b.first;
        });
    
    OrderMap result;
    rank = 1;
    for (const auto& entry : ranked) {
        result[entry.first] = rank++;
    }
    return result;
}

void RegionStore::Normalize() {
    int rank = 1;
    for (Region* region : SortedNonEmpty<Region*>(m_regions)) {
        region->order = rank++;
    }
    m_regions[EMPTY_REGION_ID].order = 0;
}

void RegionStore::SetNextId(RegionId nextId) {
    RegionId floor = 1;
    for (const auto& entry : m_regions) {
        floor = std::max(floor, entry.first + 1);
    }
    m_nextId = std::max(nextId, floor);
}

} // namespace GridPlanner
