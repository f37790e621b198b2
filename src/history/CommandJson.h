#pragma once

#include "ICommand.h"
#include "../Grid.h"
#include "../Color.h"
#include "../RegionStore.h"
#include "../CellMap.h"
#include <nlohmann/json.hpp>
#include <memory>

namespace GridPlanner {

/**
 * Serialize a command with its "type" tag and header fields.
 */
nlohmann::json CommandToJson(const ICommand& cmd);

/**
 * Rebuild a command from CommandToJson output.
 * @return nullptr (logged) for an unknown tag or malformed entry
 */
std::unique_ptr<ICommand> CommandFromJson(const nlohmann::json& j);

// Field helpers shared by the command classes
CommandHeader HeaderFromJson(const nlohmann::json& j);

/**
 * Numeric id (surface, region) from an object key ("1", "42").
 * Rejects anything else.
 */
std::optional<uint32_t> ParseIdKey(const std::string& key);

nlohmann::json GridToJson(const GridDescriptor& grid);
GridDescriptor GridFromJson(const nlohmann::json& j);

nlohmann::json RegionToJson(const Region& region);
Region RegionFromJson(const nlohmann::json& j);

/**
 * Cell map as {"x:y": regionId}.
 */
nlohmann::json CellsToJson(const CellMap& cells);

/**
 * Inverse of CellsToJson. Malformed keys are skipped.
 */
CellMap CellsFromJson(const nlohmann::json& j);

} // namespace GridPlanner
