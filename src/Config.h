#pragma once

#include "Grid.h"
#include "Color.h"
#include <string>
#include <vector>
#include <utility>

namespace GridPlanner {

/**
 * Region every new workspace starts with.
 */
struct DefaultRegion {
    std::string name;
    Color color;
};

/**
 * Engine settings (persisted as JSON next to the snapshots).
 * Every field has a usable default, so a missing or partial file is fine.
 */
struct PlannerConfig {
    size_t undoCapacity;            // Per-user undo entries
    GridDescriptor defaultGrid;     // Grid of a surface never configured
    int defaultVisibility;          // Boundary visibility of new users
    std::vector<DefaultRegion> defaultRegions;
    
    PlannerConfig();
    
    /**
     * Built-in region list (Belts, Trains, ... Utility).
     */
    static std::vector<DefaultRegion> BuiltinRegions();
    
    /**
     * Default regions in the form Model::SeedRegions takes.
     */
    std::vector<std::pair<std::string, Color>> RegionSeeds() const;
    
    /**
     * Parse settings from JSON. Unknown keys are ignored, out-of-range
     * values are clamped.
     * @param json JSON text
     * @param outConfig Receives the parsed settings (untouched on error)
     * @return true on success
     */
    static bool LoadFromString(const std::string& json, 
                               PlannerConfig& outConfig);
    
    /**
     * Load settings from a file. A missing file keeps the defaults and
     * still counts as success.
     */
    static bool LoadFromFile(const std::string& path, 
                             PlannerConfig& outConfig);
    
    std::string SaveToString() const;
    bool SaveToFile(const std::string& path) const;
};

} // namespace GridPlanner
