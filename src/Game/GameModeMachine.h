#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <optional>

struct DrawContext;
struct InputEvent;
class Input;

enum class GameMode : std::uint8_t
{
    Menu,
    Playing,
    Paused,
    EraTransition
};

constexpr int kGameModeCount = 4;

const char *GameModeName(GameMode mode);

// Pedido de troca devolvido pelos handlers; a maquina valida e aplica
using ModeRequest = std::optional<GameMode>;

struct ModeHandlers
{
    std::function<void(GameMode previous)> onEnter;
    std::function<ModeRequest(const InputEvent &)> handleInput;
    std::function<void(const Input &)> sampleHeld;
    std::function<ModeRequest(float dtMs)> update;
    std::function<void(DrawContext &)> draw;
};

class GameModeMachine
{
public:
    GameModeMachine(std::array<ModeHandlers, kGameModeCount> handlers, GameMode initial);

    static bool IsLegal(GameMode from, GameMode to);

    // false (e nada muda) se a aresta nao existe
    bool transitionTo(GameMode next);
    GameMode current() const { return current_; }

    void handleInput(const InputEvent &event);
    void sampleHeld(const Input &input);
    void update(float dtMs);
    void draw(DrawContext &ctx);

private:
    const ModeHandlers &active() const { return handlers_[static_cast<int>(current_)]; }
    void apply(const ModeRequest &request);

private:
    std::array<ModeHandlers, kGameModeCount> handlers_;
    GameMode current_;
};
