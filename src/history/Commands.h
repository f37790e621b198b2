#pragma once

/**
 * Convenience header that includes all history command types.
 * Include this header to access all command classes.
 */

// Core
#include "ICommand.h"
#include "History.h"

// Snapshot structs
#include "RegionPropertiesSnapshot.h"

// Region commands
#include "AddRegionCommand.h"
#include "EditRegionCommand.h"
#include "DeleteRegionCommand.h"
#include "MoveRegionCommand.h"

// Cell commands
#include "FillCellsCommand.h"

// Grid commands
#include "GridChangeCommand.h"
#include "ReprojectCommand.h"

// Serialization
#include "CommandJson.h"
