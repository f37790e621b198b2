#include "Time.h"
#include <SDL3/SDL.h>

namespace Platform {

uint64_t GetTicksMs() {
    return SDL_GetTicks();
}

} // namespace Platform
