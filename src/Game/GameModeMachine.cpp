#include "GameModeMachine.h"
#include "DrawContext.h"
#include "../Input/Input.h"
#include <cstdio>

const char *GameModeName(GameMode mode)
{
    switch (mode)
    {
    case GameMode::Menu:
        return "Menu";
    case GameMode::Playing:
        return "Playing";
    case GameMode::Paused:
        return "Paused";
    case GameMode::EraTransition:
        return "EraTransition";
    }
    return "Unknown";
}

GameModeMachine::GameModeMachine(std::array<ModeHandlers, kGameModeCount> handlers, GameMode initial)
    : handlers_(std::move(handlers)),
      current_(initial)
{
    if (active().onEnter)
        active().onEnter(initial);
}

bool GameModeMachine::IsLegal(GameMode from, GameMode to)
{
    // linhas = origem, colunas = destino (Menu, Playing, Paused, EraTransition)
    static const bool table[kGameModeCount][kGameModeCount] = {
        {false, true, false, false}, // Menu
        {false, false, true, true},  // Playing
        {true, true, false, false},  // Paused
        {false, true, false, false}, // EraTransition
    };
    return table[static_cast<int>(from)][static_cast<int>(to)];
}

bool GameModeMachine::transitionTo(GameMode next)
{
    if (!IsLegal(current_, next))
    {
        std::printf("GameModeMachine: refused %s -> %s\n", GameModeName(current_), GameModeName(next));
        return false;
    }

    GameMode previous = current_;
    current_ = next;
    std::printf("GameModeMachine: %s -> %s\n", GameModeName(previous), GameModeName(next));

    if (active().onEnter)
        active().onEnter(previous);
    return true;
}

void GameModeMachine::apply(const ModeRequest &request)
{
    if (request)
        transitionTo(*request);
}

void GameModeMachine::handleInput(const InputEvent &event)
{
    if (active().handleInput)
        apply(active().handleInput(event));
}

void GameModeMachine::sampleHeld(const Input &input)
{
    if (active().sampleHeld)
        active().sampleHeld(input);
}

void GameModeMachine::update(float dtMs)
{
    if (active().update)
        apply(active().update(dtMs));
}

void GameModeMachine::draw(DrawContext &ctx)
{
    if (active().draw)
        active().draw(ctx);
}
