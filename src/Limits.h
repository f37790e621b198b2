#pragma once

#include <cstddef>

namespace GridPlanner {

/**
 * Security limits for snapshot loading and input validation.
 * These constants prevent malicious files or runaway drags from causing
 * memory exhaustion or unbounded work inside a single command.
 */
namespace Limits {

// Maximum JSON snapshot size before parsing (64 MB)
constexpr size_t MAX_SNAPSHOT_JSON_SIZE = 64 * 1024 * 1024;

// Maximum config file size before parsing (1 MB)
constexpr size_t MAX_CONFIG_JSON_SIZE = 1024 * 1024;

// Largest rectangle a single fill may touch (cells)
constexpr long long MAX_FILL_CELLS = 4000000;

// Collection size limits from JSON (prevents OOM from malicious files)
constexpr size_t MAX_WORKSPACES = 10000;
constexpr size_t MAX_USERS = 100000;
constexpr size_t MAX_REGIONS = 10000;
constexpr size_t MAX_SURFACES = 1000;
constexpr size_t MAX_CELLS_PER_SURFACE = 10000000;

// Undo history
constexpr size_t DEFAULT_UNDO_CAPACITY = 100;
constexpr size_t MAX_UNDO_CAPACITY = 10000;

// Boundary visibility levels (0 = hidden, 3 = strongest)
constexpr int MIN_VISIBILITY_LEVEL = 0;
constexpr int MAX_VISIBILITY_LEVEL = 3;
constexpr int DEFAULT_VISIBILITY_LEVEL = 2;

}  // namespace Limits
}  // namespace GridPlanner
