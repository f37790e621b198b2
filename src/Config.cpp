#include "Config.h"
#include "Limits.h"
#include "platform/Fs.h"
#include <SDL3/SDL.h>
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace GridPlanner {

PlannerConfig::PlannerConfig()
    : undoCapacity(Limits::DEFAULT_UNDO_CAPACITY)
    , defaultGrid()
    , defaultVisibility(Limits::DEFAULT_VISIBILITY_LEVEL)
    , defaultRegions(BuiltinRegions())
{}

std::vector<DefaultRegion> PlannerConfig::BuiltinRegions() {
    return {
        {"Belts", Color(1.0f, 0.8f, 0.0f)},
        {"Trains", Color(0.9f, 0.8f, 0.7f)},
        {"Stations", Color(0.7f, 0.6f, 0.5f)},
        {"Primary Products", Color(0.5f, 0.5f, 1.0f)},
        {"Intermediate Products", Color(0.4f, 1.0f, 0.4f)},
        {"End Products", Color(1.0f, 0.5f, 0.33f)},
        {"Research", Color(0.5f, 0.75f, 1.0f)},
        {"Power", Color(1.0f, 1.0f, 0.5f)},
        {"Military", Color(0.8f, 0.2f, 0.2f)},
        {"Utility", Color(0.9f, 0.4f, 0.8f)},
    };
}

std::vector<std::pair<std::string, Color>> PlannerConfig::RegionSeeds() const {
    std::vector<std::pair<std::string, Color>> seeds;
    seeds.reserve(defaultRegions.size());
    for (const auto& def : defaultRegions) {
        seeds.emplace_back(def.name, def.color);
    }
    return seeds;
}

bool PlannerConfig::LoadFromString(const std::string& jsonStr,
                                   PlannerConfig& outConfig) {
    if (jsonStr.size() > Limits::MAX_CONFIG_JSON_SIZE) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Config rejected: %zu bytes exceeds limit",
                     jsonStr.size());
        return false;
    }
    
    PlannerConfig config;
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "Config rejected: top level is not an object");
            return false;
        }
        
        if (j.contains("undoCapacity")) {
            long long capacity = j["undoCapacity"].get<long long>();
            config.undoCapacity = static_cast<size_t>(std::clamp<long long>(
                capacity, 1,
                static_cast<long long>(Limits::MAX_UNDO_CAPACITY)));
        }
        
        if (j.contains("defaultVisibility")) {
            config.defaultVisibility = std::clamp(
                j["defaultVisibility"].get<int>(),
                Limits::MIN_VISIBILITY_LEVEL, Limits::MAX_VISIBILITY_LEVEL);
        }
        
        if (j.contains("defaultGrid")) {
            const auto& grid = j["defaultGrid"];
            GridDescriptor g;
            g.width = grid.value("width", g.width);
            g.height = grid.value("height", g.height);
            g.xOffset = grid.value("xOffset", g.xOffset);
            g.yOffset = grid.value("yOffset", g.yOffset);
            if (!IsValidGrid(g)) {
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                            "Config: invalid defaultGrid ignored");
            } else {
                config.defaultGrid = g;
            }
        }
        
        if (j.contains("defaultRegions") && j["defaultRegions"].is_array() &&
            j["defaultRegions"].size() <= Limits::MAX_REGIONS) {
            config.defaultRegions.clear();
            for (const auto& region : j["defaultRegions"]) {
                DefaultRegion def;
                def.name = region.value("name", "");
                def.color = Color::FromHex(region.value("color", "#000000"));
                if (def.name.empty()) {
                    continue;
                }
                config.defaultRegions.push_back(def);
            }
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Config parse error: %s", e.what());
        return false;
    }
    
    outConfig = config;
    return true;
}

bool PlannerConfig::LoadFromFile(const std::string& path,
                                 PlannerConfig& outConfig) {
    if (!Platform::FileExists(path)) {
        return true;  // No config file yet - use defaults
    }
    auto content = Platform::ReadTextFile(path);
    if (!content) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Could not read config %s", path.c_str());
        return false;
    }
    return LoadFromString(*content, outConfig);
}

std::string PlannerConfig::SaveToString() const {
    json j;
    j["undoCapacity"] = undoCapacity;
    j["defaultVisibility"] = defaultVisibility;
    j["defaultGrid"] = {
        {"width", defaultGrid.width},
        {"height", defaultGrid.height},
        {"xOffset", defaultGrid.xOffset},
        {"yOffset", defaultGrid.yOffset}
    };
    j["defaultRegions"] = json::array();
    for (const auto& def : defaultRegions) {
        j["defaultRegions"].push_back({
            {"name", def.name},
            {"color", def.color.ToHex(false)}
        });
    }
    return j.dump(2);
}

bool PlannerConfig::SaveToFile(const std::string& path) const {
    return Platform::WriteTextFile(path, SaveToString());
}

} // namespace GridPlanner
