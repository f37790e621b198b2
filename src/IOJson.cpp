#include "IOJson.h"
#include "Store.h"
#include "Limits.h"
#include "history/CommandJson.h"
#include "platform/Fs.h"
#include <SDL3/SDL.h>
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace GridPlanner {

// Helper: Serialize one history stack, bottom first
static json StackToJson(const History::Stack& stack) {
    json j = json::array();
    for (const auto& cmd : stack) {
        if (cmd) {
            j.push_back(CommandToJson(*cmd));
        }
    }
    return j;
}

// Helper: Rebuild a history stack, skipping entries that fail to load
static History::Stack StackFromJson(const json& j) {
    History::Stack stack;
    if (!j.is_array()) {
        return stack;
    }
    for (const auto& entry : j) {
        auto cmd = CommandFromJson(entry);
        if (cmd) {
            stack.push_back(std::move(cmd));
        }
    }
    return stack;
}

std::string IOJson::SaveToString(const Store& store) {
    json j;
    
    j["version"] = SNAPSHOT_VERSION;
    j["undoCapacity"] = store.GetUndoCapacity();
    
    // Workspaces
    j["workspaces"] = json::array();
    for (const auto& [id, model] : store.GetWorkspaces()) {
        json jWorkspace = {
            {"id", id},
            {"nextRegionId", model.regions.NextId()}
        };
        
        jWorkspace["regions"] = json::array();
        for (const auto& region : model.regions.GetOrdered(false)) {
            jWorkspace["regions"].push_back(RegionToJson(region));
        }
        
        jWorkspace["grids"] = json::object();
        for (const auto& [surface, grid] : model.grids) {
            jWorkspace["grids"][std::to_string(surface)] = GridToJson(grid);
        }
        
        jWorkspace["images"] = json::object();
        for (const auto& [surface, image] : model.images) {
            if (image.Empty()) {
                continue;
            }
            jWorkspace["images"][std::to_string(surface)] = {
                {"cells", CellsToJson(image)}
            };
        }
        
        j["workspaces"].push_back(jWorkspace);
    }
    
    // Users
    j["users"] = json::array();
    for (const auto& [id, user] : store.GetUsers()) {
        json jUser = {
            {"id", id},
            {"selectedRegionId", user.selectedRegionId},
            {"boundaryVisibility", user.boundaryVisibility},
            {"undo", StackToJson(user.history.GetUndoStack())},
            {"redo", StackToJson(user.history.GetRedoStack())}
        };
        jUser["workspace"] = user.workspace ? json(*user.workspace) 
                                            : json(nullptr);
        jUser["selectedTool"] = user.selectedTool ? json(*user.selectedTool)
                                                  : json(nullptr);
        j["users"].push_back(jUser);
    }
    
    return j.dump(2);  // Pretty print with 2-space indent
}

bool IOJson::UpgradeSnapshot(json& snapshot) {
    if (!snapshot.is_object()) {
        return false;
    }
    int version = snapshot.value("version", 0);
    if (version < 1 || version > SNAPSHOT_VERSION) {
        return false;
    }
    
    if (version == 1) {
        // Single grid per workspace -> one grid per surface
        if (snapshot.contains("workspaces") && 
            snapshot["workspaces"].is_array()) {
            for (auto& workspace : snapshot["workspaces"]) {
                if (!workspace.is_object() || !workspace.contains("grid")) {
                    continue;
                }
                json grid = workspace["grid"];
                json grids = json::object();
                if (workspace.contains("images") && 
                    workspace["images"].is_object()) {
                    for (const auto& item : workspace["images"].items()) {
                        grids[item.key()] = grid;
                    }
                }
                if (grids.empty()) {
                    grids["1"] = grid;
                }
                workspace["grids"] = grids;
                workspace.erase("grid");
            }
        }
        snapshot["version"] = 2;
        SDL_Log("Upgraded snapshot from version 1 to 2");
    }
    
    return true;
}

bool IOJson::LoadFromString(const std::string& jsonStr, Store& outStore) {
    // Security: check JSON size before parsing
    if (jsonStr.size() > Limits::MAX_SNAPSHOT_JSON_SIZE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Snapshot too large (%zu bytes)", jsonStr.size());
        return false;
    }
    
    try {
        json j = json::parse(jsonStr);
        
        if (!UpgradeSnapshot(j)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Unsupported snapshot version");
            return false;
        }
        
        // Build into a fresh store so a failure leaves outStore untouched
        Store loaded(outStore.GetConfig());
        if (j.contains("undoCapacity")) {
            loaded.SetUndoCapacity(j["undoCapacity"].get<size_t>());
        }
        
        // Workspaces
        const json& workspaces = j.value("workspaces", json::array());
        if (workspaces.size() > Limits::MAX_WORKSPACES) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Snapshot has too many workspaces");
            return false;
        }
        for (const auto& jWorkspace : workspaces) {
            Model model(jWorkspace.at("id").get<WorkspaceId>(),
                        outStore.GetConfig().defaultGrid);
            
            // Regions, inserted in display order so nothing shifts
            const json& jRegions = jWorkspace.value("regions", json::array());
            if (jRegions.size() > Limits::MAX_REGIONS) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                             "Workspace %u has too many regions", model.id);
                return false;
            }
            std::vector<Region> regions;
            for (const auto& jRegion : jRegions) {
                Region region = RegionFromJson(jRegion);
                if (region.id != EMPTY_REGION_ID) {
                    regions.push_back(region);
                }
            }
            std::stable_sort(regions.begin(), regions.end(),
                [](const Region& a, const Region& b) {
                    return a.order < b.order;
                });
            for (Region& region : regions) {
                region.order = 0;   // Append
                if (!model.regions.Insert(region)) {
                    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                                "Skipping duplicate region %u", region.id);
                }
            }
            model.regions.SetNextId(jWorkspace.value("nextRegionId", 1u));
            
            // Grids
            if (jWorkspace.contains("grids")) {
                const json& jGrids = jWorkspace["grids"];
                if (jGrids.size() > Limits::MAX_SURFACES) {
                    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                                 "Workspace %u has too many grids", model.id);
                    return false;
                }
                for (const auto& item : jGrids.items()) {
                    std::optional<uint32_t> surface = ParseIdKey(item.key());
                    GridDescriptor grid = GridFromJson(item.value());
                    if (!surface || !IsValidGrid(grid)) {
                        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                                    "Skipping invalid grid '%s'",
                                    item.key().c_str());
                        continue;
                    }
                    model.grids[*surface] = grid;
                }
            }
            
            // Images
            if (jWorkspace.contains("images")) {
                const json& jImages = jWorkspace["images"];
                if (jImages.size() > Limits::MAX_SURFACES) {
                    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                                 "Workspace %u has too many images", model.id);
                    return false;
                }
                for (const auto& item : jImages.items()) {
                    std::optional<uint32_t> surface = ParseIdKey(item.key());
                    if (!surface) {
                        continue;
                    }
                    const json& jCells = item.value().value("cells", 
                                                            json::object());
                    if (jCells.size() > Limits::MAX_CELLS_PER_SURFACE) {
                        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                                     "Surface %u has too many cells",
                                     *surface);
                        return false;
                    }
                    
                    CellMap cells = CellsFromJson(jCells);
                    CellMap& image = model.GetImage(*surface);
                    size_t dangling = 0;
                    for (const auto& [cell, regionId] : cells.Cells()) {
                        if (!model.regions.Contains(regionId)) {
                            ++dangling;
                            continue;
                        }
                        image.Set(cell, regionId);
                    }
                    if (dangling > 0) {
                        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                                    "Dropped %zu cells of unknown regions",
                                    dangling);
                    }
                }
            }
            
            loaded.PutWorkspace(std::move(model));
        }
        
        // Users
        const json& users = j.value("users", json::array());
        if (users.size() > Limits::MAX_USERS) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Snapshot has too many users");
            return false;
        }
        for (const auto& jUser : users) {
            UserState& user = loaded.EnsureUser(
                jUser.at("id").get<UserId>());
            
            if (jUser.contains("workspace") && 
                jUser["workspace"].is_number_unsigned()) {
                user.workspace = jUser["workspace"].get<WorkspaceId>();
            }
            user.selectedRegionId = jUser.value("selectedRegionId",
                                                EMPTY_REGION_ID);
            if (jUser.contains("selectedTool") &&
                jUser["selectedTool"].is_string()) {
                user.selectedTool = jUser["selectedTool"].get<std::string>();
            }
            user.boundaryVisibility = std::clamp(
                jUser.value("boundaryVisibility",
                            Limits::DEFAULT_VISIBILITY_LEVEL),
                Limits::MIN_VISIBILITY_LEVEL, Limits::MAX_VISIBILITY_LEVEL);
            
            user.history.LoadStacks(
                StackFromJson(jUser.value("undo", json::array())),
                StackFromJson(jUser.value("redo", json::array())));
        }
        
        loaded.ClearDirty();
        outStore = std::move(loaded);
        return true;
        
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Failed to load snapshot: %s", e.what());
        return false;
    }
}

bool IOJson::SaveToFile(const Store& store, const std::string& path) {
    std::string json = SaveToString(store);
    return Platform::WriteTextFile(path, json);
}

bool IOJson::LoadFromFile(const std::string& path, Store& outStore) {
    auto content = Platform::ReadTextFile(path);
    if (!content) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Cannot read snapshot '%s'", path.c_str());
        return false;
    }
    return LoadFromString(*content, outStore);
}

} // namespace GridPlanner
