#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace GridPlanner {

class Store;

/**
 * JSON serialization for engine snapshots.
 * A snapshot holds every workspace (regions, grids, cells) and every user
 * (selection, tool, visibility, undo/redo stacks).
 */
class IOJson {
public:
    // Schema version written by SaveToString
    static constexpr int SNAPSHOT_VERSION = 2;
    
    /**
     * Save store to JSON string.
     * @param store Store to save
     * @return JSON string
     */
    static std::string SaveToString(const Store& store);
    
    /**
     * Load store from JSON string. Older schema versions are upgraded
     * first. The store is replaced only if the whole snapshot loads.
     * @param json JSON string
     * @param outStore Output store (keeps its configuration)
     * @return true on success, false on error
     */
    static bool LoadFromString(const std::string& json, Store& outStore);
    
    /**
     * Save store to JSON file.
     * @param store Store to save
     * @param path File path
     * @return true on success
     */
    static bool SaveToFile(const Store& store, const std::string& path);
    
    /**
     * Load store from JSON file.
     * @param path File path
     * @param outStore Output store
     * @return true on success
     */
    static bool LoadFromFile(const std::string& path, Store& outStore);
    
    /**
     * Bring a parsed snapshot up to SNAPSHOT_VERSION in place.
     * Version 1 kept a single "grid" per workspace; it is copied to every
     * surface that has an image (or to surface 1 when none does).
     * @return false for a missing or unsupported version
     */
    static bool UpgradeSnapshot(nlohmann::json& snapshot);
};

} // namespace GridPlanner
