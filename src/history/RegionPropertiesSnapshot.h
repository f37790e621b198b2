#pragma once

#include "../Color.h"
#include <string>

namespace GridPlanner {

/**
 * Snapshot of region properties for undo/redo.
 */
struct RegionPropertiesSnapshot {
    std::string name;
    Color color;
    
    bool operator==(const RegionPropertiesSnapshot& other) const {
        return name == other.name && color == other.color;
    }
    
    bool operator!=(const RegionPropertiesSnapshot& other) const {
        return !(*this == other);
    }
};

} // namespace GridPlanner
