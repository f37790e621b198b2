#pragma once

#include <stdexcept>
#include <string>

namespace GridPlanner {

enum class ErrorCode {
    ReservedRegion,       // Edit/delete/move of the Empty region
    RegionNotFound,       // Unknown target region
    ReplacementNotFound,  // Unknown or invalid replacement region
    InvalidGrid,          // Non-positive or non-finite grid geometry
    FillTooLarge,         // Rectangle exceeds Limits::MAX_FILL_CELLS
    OutOfRange,           // World position outside the int cell space
    ReprojectTooLarge     // Result exceeds Limits::MAX_CELLS_PER_SURFACE
};

/**
 * Thrown when a command is built from a request that cannot be applied.
 * Nothing has been modified when this is thrown.
 */
class ValidationError : public std::runtime_error {
public:
    ValidationError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}
    
    ErrorCode GetCode() const { return m_code; }
    
private:
    ErrorCode m_code;
};

} // namespace GridPlanner
