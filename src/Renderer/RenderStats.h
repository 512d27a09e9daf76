#pragma once
#include <cstdint>

struct RenderStats
{
    std::uint64_t frameIndex = 0;

    std::uint32_t commandsSubmitted = 0;
    std::uint32_t rectDraws = 0;
    std::uint32_t textureDraws = 0;
    std::uint32_t textDraws = 0;
};
