#include <gtest/gtest.h>

#include <vector>

#include "Game/Game.h"
#include "ManualClock.h"
#include "Renderer/CommandBuffer.h"

namespace {

InputEvent Down(Key key)
{
    InputEvent e;
    e.type = InputEventType::KeyDown;
    e.key = key;
    return e;
}

// fade em 4 + 4 passos
GameConfig FastTransitionConfig()
{
    GameConfig config;
    config.transitionRate = 0.25f;
    return config;
}

class GameTests : public ::testing::Test
{
protected:
    // um frame de exatamente um passo fixo
    StepPlan step(const std::vector<InputEvent> &events = {})
    {
        for (const auto &e : events)
            input.apply(e);
        StepPlan plan = game.frame(events, input, game.scheduler().fixedStep());
        input.beginFrame();
        return plan;
    }

    GameConfig config = FastTransitionConfig();
    ManualClock clock;
    Input input;
    Game game{config, clock, input, nullptr};
};

TEST_F(GameTests, StartsInMenuWithoutResume) {
    EXPECT_EQ(game.mode(), GameMode::Menu);
    ASSERT_EQ(game.menu().options().size(), 2u);
    EXPECT_EQ(game.menu().options()[0], MenuMode::Option::Tutorial);
}

TEST_F(GameTests, ConfirmStartsTutorial) {
    step({Down(Key::Return)});
    EXPECT_EQ(game.mode(), GameMode::Playing);
    EXPECT_EQ(game.playing().levelIndex(), 0);
    EXPECT_EQ(game.playing().player().era(), Era::Medieval);
}

TEST_F(GameTests, DemoIsLastLevel) {
    step({Down(Key::Down)});
    step({Down(Key::Return)});
    EXPECT_EQ(game.mode(), GameMode::Playing);
    EXPECT_EQ(game.playing().levelIndex(), game.playing().levelCount() - 1);
}

TEST_F(GameTests, EscapeInMenuRequestsQuit) {
    EXPECT_FALSE(game.quitRequested());
    step({Down(Key::Escape)});
    EXPECT_TRUE(game.quitRequested());
}

TEST_F(GameTests, QuitEventRequestsQuit) {
    InputEvent quit;
    quit.type = InputEventType::Quit;
    step({quit});
    EXPECT_TRUE(game.quitRequested());
}

TEST_F(GameTests, PauseFreezesAndResumes) {
    step({Down(Key::Return)});
    for (int i = 0; i < 5; ++i)
        step();

    step({Down(Key::Escape)});
    ASSERT_EQ(game.mode(), GameMode::Paused);

    const Entity *p = game.playing().player().entity(game.playing().scene());
    ASSERT_NE(p, nullptr);
    float y = p->transform.y;
    for (int i = 0; i < 10; ++i)
        step();
    EXPECT_FLOAT_EQ(game.playing().player().entity(game.playing().scene())->transform.y, y);
    EXPECT_GT(game.paused().overlayAlpha(), 0.0f);

    step({Down(Key::Escape)});
    EXPECT_EQ(game.mode(), GameMode::Playing);
}

TEST_F(GameTests, PauseMenuReturnsToMenu) {
    step({Down(Key::Return)});
    step({Down(Key::Escape)});
    step({Down(Key::Down)});
    step({Down(Key::Return)});
    EXPECT_EQ(game.mode(), GameMode::Menu);
}

TEST_F(GameTests, PausedIgnoresGameplayKeys) {
    step({Down(Key::Return)});
    for (int i = 0; i < 5; ++i)
        step();
    step({Down(Key::Escape)});
    ASSERT_EQ(game.mode(), GameMode::Paused);

    const Entity *p = game.playing().player().entity(game.playing().scene());
    ASSERT_NE(p, nullptr);
    const float x = p->transform.x;
    const float y = p->transform.y;
    const Era era = game.playing().player().era();

    for (Key key : {Key::Q, Key::Z, Key::LShift, Key::F, Key::F5, Key::Space, Key::E})
    {
        step({Down(key)});
        EXPECT_EQ(game.mode(), GameMode::Paused) << "key " << (int)key;
        EXPECT_FALSE(game.timeScale().slowMotionActive());
        EXPECT_FALSE(game.timeScale().transitioning());
    }

    p = game.playing().player().entity(game.playing().scene());
    ASSERT_NE(p, nullptr);
    EXPECT_FLOAT_EQ(p->transform.x, x);
    EXPECT_FLOAT_EQ(p->transform.y, y);
    EXPECT_EQ(game.playing().player().era(), era);
    EXPECT_EQ(game.timeScale().currentEra(), era);
}

TEST_F(GameTests, MenuIgnoresUnboundKeysAndRepeatedBack) {
    step({Down(Key::Q)});
    EXPECT_EQ(game.mode(), GameMode::Menu);

    InputEvent held = Down(Key::Escape);
    held.repeat = true;
    step({held});
    EXPECT_EQ(game.mode(), GameMode::Menu);
    EXPECT_FALSE(game.quitRequested());
}

TEST_F(GameTests, EraSwitchRunsThroughTransition) {
    step({Down(Key::Return)});
    for (int i = 0; i < 5; ++i)
        step();

    step({Down(Key::Q)});
    ASSERT_EQ(game.mode(), GameMode::EraTransition);
    EXPECT_EQ(game.timeScale().targetEra(), Era::Futuristic);

    const Scene &scene = game.playing().scene();
    float y = game.playing().player().entity(scene)->transform.y;

    // 0.25 por passo: 4 passos ate trocar, 4 de volta
    for (int i = 0; i < 2; ++i)
        step();
    EXPECT_EQ(game.playing().player().era(), Era::Medieval);

    for (int i = 0; i < 3; ++i)
        step();
    EXPECT_EQ(game.playing().player().era(), Era::Futuristic);
    EXPECT_EQ(game.mode(), GameMode::EraTransition);
    EXPECT_FLOAT_EQ(game.playing().player().entity(scene)->transform.y, y);

    for (int i = 0; i < 3; ++i)
        step();
    EXPECT_EQ(game.mode(), GameMode::Playing);
    EXPECT_EQ(game.timeScale().currentEra(), Era::Futuristic);
    EXPECT_FALSE(game.timeScale().transitioning());
}

TEST_F(GameTests, PrevEraTargetsPreviousEra) {
    step({Down(Key::Return)});
    step({Down(Key::Z)});
    ASSERT_EQ(game.mode(), GameMode::EraTransition);
    EXPECT_EQ(game.timeScale().targetEra(), Era::Prehistoric);

    // input ignorado durante o fade
    step({Down(Key::Escape)});
    EXPECT_EQ(game.mode(), GameMode::EraTransition);
}

TEST_F(GameTests, SlowMotionHalvesSimulationStep) {
    step({Down(Key::Return)});
    step({Down(Key::LShift)});
    EXPECT_TRUE(game.timeScale().slowMotionActive());
    EXPECT_FLOAT_EQ(game.timeScale().timeScale(), 0.5f);

    clock.advance(5000);
    step();
    EXPECT_FALSE(game.timeScale().slowMotionActive());
    EXPECT_FLOAT_EQ(game.timeScale().timeScale(), 1.0f);
}

TEST_F(GameTests, HeldKeysMovePlayer) {
    step({Down(Key::Return)});
    const Scene &scene = game.playing().scene();
    float x = game.playing().player().entity(scene)->transform.x;

    input.setKeyDown(Key::D, true);
    for (int i = 0; i < 10; ++i)
        step();
    EXPECT_GT(game.playing().player().entity(scene)->transform.x, x);
}

TEST_F(GameTests, EraTransitionDrawsOverlay) {
    step({Down(Key::Return)});
    step({Down(Key::Q)});
    step();

    CommandBuffer cmds;
    DrawContext ctx{cmds};
    game.draw(ctx);

    bool overlay = false;
    for (const RenderCommand &cmd : cmds.commands())
    {
        if (cmd.layer == 500 && cmd.type == RenderCommandType::Rect && cmd.screenSpace)
            overlay = overlay || cmd.a > 0;
    }
    EXPECT_TRUE(overlay);
}

TEST_F(GameTests, SuspendNeedsSaveManager) {
    step({Down(Key::Return)});
    EXPECT_FALSE(game.suspendSession());
}

} // namespace
