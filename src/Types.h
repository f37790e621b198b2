#pragma once

#include <cstdint>
#include <optional>

namespace GridPlanner {

using WorkspaceId = uint32_t;
using UserId = uint32_t;
using SurfaceId = uint32_t;
using RegionId = uint32_t;

// Built-in "(Empty)" region; as a cell value it means "unassigned"
constexpr RegionId EMPTY_REGION_ID = 0;

/**
 * Collapse the two spellings of "unassigned" (absent, or the Empty id)
 * into the Empty id. Call at every API boundary that accepts a region.
 */
inline RegionId NormalizeRegionId(std::optional<RegionId> regionId) {
    return regionId.value_or(EMPTY_REGION_ID);
}

} // namespace GridPlanner
