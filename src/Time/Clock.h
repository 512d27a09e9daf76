#pragma once
#include <cstdint>

// Fonte de wall-clock em milissegundos. Engine usa SDLClock; testes usam um relogio manual.
class Clock
{
public:
    virtual ~Clock() = default;

    virtual std::uint64_t nowMs() const = 0;
};
