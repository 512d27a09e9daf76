#include "Game.h"
#include "../Persistence/SaveManager.h"
#include <cstdio>

static TimeScaleSettings MakeTimeScaleSettings(const GameConfig &c)
{
    TimeScaleSettings s;
    s.slowMotionFactor = c.slowMotionFactor;
    s.slowMotionDurationMs = (std::uint64_t)c.slowMotionDurationMs;
    s.slowMotionCooldownMs = (std::uint64_t)c.slowMotionCooldownMs;
    s.transitionRate = c.transitionRate;
    return s;
}

static const Input &Bind(Input &input)
{
    BindDefaultControls(input);
    return input;
}

Game::Game(const GameConfig &config, const Clock &clock, Input &input, SaveManager *saves,
           EraBackgrounds backgrounds)
    : saves_(saves),
      scheduler_(config.fixedStepMs, config.maxFrameSteps),
      timeScale_(clock, MakeTimeScaleSettings(config)),
      playing_(config, Bind(input), timeScale_, saves, std::move(backgrounds)),
      menu_(input, playing_, saves),
      paused_(input, playing_),
      eraTransition_(playing_, timeScale_),
      machine_(buildHandlers(), GameMode::Menu)
{
}

std::array<ModeHandlers, kGameModeCount> Game::buildHandlers()
{
    std::array<ModeHandlers, kGameModeCount> table;

    ModeHandlers &menu = table[static_cast<int>(GameMode::Menu)];
    menu.onEnter = [this](GameMode previous)
    { menu_.onEnter(previous); };
    menu.handleInput = [this](const InputEvent &e)
    { return menu_.handleInput(e); };
    menu.update = [this](float dt)
    { return menu_.update(dt); };
    menu.draw = [this](DrawContext &ctx)
    { menu_.draw(ctx); };

    ModeHandlers &playing = table[static_cast<int>(GameMode::Playing)];
    playing.onEnter = [this](GameMode previous)
    { playing_.onEnter(previous); };
    playing.handleInput = [this](const InputEvent &e)
    { return playing_.handleInput(e); };
    playing.sampleHeld = [this](const Input &input)
    { playing_.sampleHeld(input); };
    playing.update = [this](float dt)
    { return playing_.update(dt); };
    playing.draw = [this](DrawContext &ctx)
    { playing_.draw(ctx); };

    ModeHandlers &paused = table[static_cast<int>(GameMode::Paused)];
    paused.onEnter = [this](GameMode previous)
    { paused_.onEnter(previous); };
    paused.handleInput = [this](const InputEvent &e)
    { return paused_.handleInput(e); };
    paused.update = [this](float dt)
    { return paused_.update(dt); };
    paused.draw = [this](DrawContext &ctx)
    { paused_.draw(ctx); };

    // input ignorado durante o fade
    ModeHandlers &transition = table[static_cast<int>(GameMode::EraTransition)];
    transition.update = [this](float dt)
    { return eraTransition_.update(dt); };
    transition.draw = [this](DrawContext &ctx)
    { eraTransition_.draw(ctx); };

    return table;
}

StepPlan Game::frame(const std::vector<InputEvent> &events, const Input &held, double frameTimeMs)
{
    for (const auto &e : events)
    {
        if (e.type == InputEventType::Quit)
        {
            quit_ = true;
            continue;
        }
        machine_.handleInput(e);
    }
    machine_.sampleHeld(held);

    StepPlan plan = scheduler_.tick(frameTimeMs);
    for (int i = 0; i < plan.steps; ++i)
    {
        timeScale_.update();
        machine_.update((float)(scheduler_.fixedStep() * timeScale_.timeScale()));
    }
    return plan;
}

void Game::draw(DrawContext &ctx)
{
    ctx.interpolation = (float)scheduler_.interpolation();
    machine_.draw(ctx);
}

bool Game::suspendSession()
{
    if (!saves_)
        return false;

    GameMode m = machine_.current();
    if (m != GameMode::Playing && m != GameMode::Paused)
        return false;

    std::printf("Game: suspending session\n");
    return saves_->createSuspendSave(playing_.exportState());
}
