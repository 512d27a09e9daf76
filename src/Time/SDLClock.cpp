#include "SDLClock.h"

#include <SDL.h>

std::uint64_t SDLClock::nowMs() const
{
    return static_cast<std::uint64_t>(SDL_GetTicks64());
}
