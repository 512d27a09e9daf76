#pragma once
#include <vector>
#include "DrawContext.h"
#include "EraTransitionMode.h"
#include "GameConfig.h"
#include "GameModeMachine.h"
#include "MenuMode.h"
#include "PausedMode.h"
#include "PlayingMode.h"
#include "../Input/Input.h"
#include "../Time/FixedStepScheduler.h"
#include "../Time/TimeScaleController.h"

class Clock;
class SaveManager;

// Nucleo do jogo: sem SDL. O Engine (ou um teste) entrega eventos e tempo de frame.
class Game
{
public:
    Game(const GameConfig &config, const Clock &clock, Input &input, SaveManager *saves,
         EraBackgrounds backgrounds = EraBackgrounds{});

    // Um frame renderizado: eventos -> intencao, depois 0..N passos fixos
    StepPlan frame(const std::vector<InputEvent> &events, const Input &held, double frameTimeMs);
    void draw(DrawContext &ctx);

    // Sessao em andamento vira suspend save (chamado ao fechar a janela)
    bool suspendSession();

    bool quitRequested() const { return quit_ || menu_.quitRequested(); }

    GameMode mode() const { return machine_.current(); }
    GameModeMachine &machine() { return machine_; }
    const FixedStepScheduler &scheduler() const { return scheduler_; }
    TimeScaleController &timeScale() { return timeScale_; }
    const TimeScaleController &timeScale() const { return timeScale_; }
    PlayingMode &playing() { return playing_; }
    const PlayingMode &playing() const { return playing_; }
    const MenuMode &menu() const { return menu_; }
    const PausedMode &paused() const { return paused_; }
    const EraTransitionMode &eraTransition() const { return eraTransition_; }

private:
    std::array<ModeHandlers, kGameModeCount> buildHandlers();

private:
    SaveManager *saves_ = nullptr;

    FixedStepScheduler scheduler_;
    TimeScaleController timeScale_;

    PlayingMode playing_;
    MenuMode menu_;
    PausedMode paused_;
    EraTransitionMode eraTransition_;

    GameModeMachine machine_;
    bool quit_ = false;
};
