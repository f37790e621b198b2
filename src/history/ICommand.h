#pragma once

#include "../Types.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace GridPlanner {

class Store;
class ChangeDispatcher;

/**
 * Closed set of command kinds, used as the serialization tag.
 */
enum class CommandType {
    RegionAdd,
    RegionEdit,
    RegionDelete,
    RegionMove,
    FillCells,
    GridChange,
    Reproject
};

const char* CommandTypeName(CommandType type);
std::optional<CommandType> CommandTypeFromName(const std::string& name);

/**
 * Who issued a command, where, and when (Platform::GetTicksMs).
 */
struct CommandHeader {
    WorkspaceId workspace = 0;
    UserId user = 0;
    uint64_t timestamp = 0;
};

/**
 * Abstract command interface for undo/redo.
 * Commands are validated and fully captured when they are created; Execute
 * and Undo may then be called alternately any number of times.
 */
class ICommand {
public:
    explicit ICommand(const CommandHeader& header) : m_header(header) {}
    virtual ~ICommand() = default;
    
    /**
     * Execute the command.
     * @return false if the target workspace no longer exists
     */
    virtual bool Execute(Store& store, ChangeDispatcher& events) = 0;
    
    /**
     * Undo the command.
     */
    virtual void Undo(Store& store, ChangeDispatcher& events) = 0;
    
    /**
     * Get command description for UI.
     */
    virtual std::string GetDescription() const = 0;
    
    virtual CommandType GetType() const = 0;
    
    /**
     * Write type-specific fields. The type tag and header are written by
     * CommandToJson.
     */
    virtual void ToJson(nlohmann::json& out) const = 0;
    
    const CommandHeader& GetHeader() const { return m_header; }
    WorkspaceId GetWorkspace() const { return m_header.workspace; }
    
protected:
    CommandHeader m_header;
};

} // namespace GridPlanner
