#pragma once

#include <cstdint>

namespace Platform {

/**
 * Monotonic milliseconds since the tick source started.
 * Used to stamp commands; never goes backwards.
 */
uint64_t GetTicksMs();

} // namespace Platform
