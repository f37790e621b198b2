#include "CommandJson.h"
#include "Commands.h"
#include <SDL3/SDL.h>
#include <cstdint>

using json = nlohmann::json;

namespace GridPlanner {

json CommandToJson(const ICommand& cmd) {
    json j;
    j["type"] = CommandTypeName(cmd.GetType());
    j["workspace"] = cmd.GetHeader().workspace;
    j["user"] = cmd.GetHeader().user;
    j["timestamp"] = cmd.GetHeader().timestamp;
    cmd.ToJson(j);
    return j;
}

std::unique_ptr<ICommand> CommandFromJson(const json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Skipping history entry without a type tag");
        return nullptr;
    }
    
    std::string tag = j["type"].get<std::string>();
    std::optional<CommandType> type = CommandTypeFromName(tag);
    if (!type) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Skipping history entry with unknown type '%s'",
                    tag.c_str());
        return nullptr;
    }
    
    try {
        switch (*type) {
            case CommandType::RegionAdd:
                return AddRegionCommand::FromJson(j);
            case CommandType::RegionEdit:
                return EditRegionCommand::FromJson(j);
            case CommandType::RegionDelete:
                return DeleteRegionCommand::FromJson(j);
            case CommandType::RegionMove:
                return MoveRegionCommand::FromJson(j);
            case CommandType::FillCells:
                return FillCellsCommand::FromJson(j);
            case CommandType::GridChange:
                return GridChangeCommand::FromJson(j);
            case CommandType::Reproject:
                return ReprojectCommand::FromJson(j);
        }
    } catch (const json::exception& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Skipping malformed '%s' history entry: %s",
                    tag.c_str(), e.what());
    }
    return nullptr;
}

CommandHeader HeaderFromJson(const json& j) {
    CommandHeader header;
    header.workspace = j.value("workspace", 0u);
    header.user = j.value("user", 0u);
    header.timestamp = j.value("timestamp", uint64_t(0));
    return header;
}

std::optional<uint32_t> ParseIdKey(const std::string& key) {
    if (key.empty() || key.size() > 10 ||
        key.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    unsigned long long value = std::stoull(key);
    if (value > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

json GridToJson(const GridDescriptor& grid) {
    return json{
        {"width", grid.width},
        {"height", grid.height},
        {"xOffset", grid.xOffset},
        {"yOffset", grid.yOffset}
    };
}

GridDescriptor GridFromJson(const json& j) {
    GridDescriptor grid;
    grid.width = j.value("width", grid.width);
    grid.height = j.value("height", grid.height);
    grid.xOffset = j.value("xOffset", grid.xOffset);
    grid.yOffset = j.value("yOffset", grid.yOffset);
    return grid;
}

json RegionToJson(const Region& region) {
    return json{
        {"id", region.id},
        {"name", region.name},
        {"color", region.color.ToHex()},
        {"order", region.order}
    };
}

Region RegionFromJson(const json& j) {
    Region region;
    region.id = j.at("id").get<RegionId>();
    region.name = j.value("name", "");
    region.color = Color::FromHex(j.value("color", "#000000ff"));
    region.order = j.value("order", 0);
    return region;
}

nlohmann::json CellsToJson(const CellMap& cells) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [cell, regionId] : cells.Cells()) {
        j[CellKey(cell)] = regionId;
    }
    return j;
}

CellMap CellsFromJson(const nlohmann::json& j) {
    CellMap cells;
    for (const auto& item : j.items()) {
        std::optional<CellCoord> cell = ParseCellKey(item.key());
        if (cell) {
            cells.Set(*cell, item.value().get<RegionId>());
        }
    }
    return cells;
}

} // namespace GridPlanner
