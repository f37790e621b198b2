#include "ICommand.h"

namespace GridPlanner {

const char* CommandTypeName(CommandType type) {
    switch (type) {
        case CommandType::RegionAdd: return "region-add";
        case CommandType::RegionEdit: return "region-edit";
        case CommandType::RegionDelete: return "region-delete";
        case CommandType::RegionMove: return "region-move";
        case CommandType::FillCells: return "fill-cells";
        case CommandType::GridChange: return "grid-change";
        case CommandType::Reproject: return "reproject";
    }
    return "unknown";
}

std::optional<CommandType> CommandTypeFromName(const std::string& name) {
    static const CommandType ALL[] = {
        CommandType::RegionAdd, CommandType::RegionEdit,
        CommandType::RegionDelete, CommandType::RegionMove,
        CommandType::FillCells, CommandType::GridChange,
        CommandType::Reproject
    };
    for (CommandType type : ALL) {
        if (name == CommandTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace GridPlanner
