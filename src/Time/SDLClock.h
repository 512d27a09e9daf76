#pragma once
#include "Clock.h"

class SDLClock final : public Clock
{
public:
    std::uint64_t nowMs() const override;
};
