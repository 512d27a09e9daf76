#include <gtest/gtest.h>

#include <vector>

#include "Game/DrawContext.h"
#include "Game/GameModeMachine.h"
#include "Input/Input.h"
#include "Renderer/CommandBuffer.h"

namespace {

constexpr GameMode kModes[] = {GameMode::Menu, GameMode::Playing, GameMode::Paused, GameMode::EraTransition};

struct Recorder
{
    std::vector<GameMode> entered;
    int updates[kGameModeCount] = {};
    int draws[kGameModeCount] = {};
    ModeRequest nextRequest;
};

std::array<ModeHandlers, kGameModeCount> MakeHandlers(Recorder &rec)
{
    std::array<ModeHandlers, kGameModeCount> table;
    for (GameMode mode : kModes)
    {
        int i = static_cast<int>(mode);
        table[i].onEnter = [&rec, mode](GameMode)
        { rec.entered.push_back(mode); };
        table[i].update = [&rec, i](float) -> ModeRequest
        {
            rec.updates[i]++;
            ModeRequest r = rec.nextRequest;
            rec.nextRequest.reset();
            return r;
        };
        table[i].draw = [&rec, i](DrawContext &)
        { rec.draws[i]++; };
    }
    return table;
}

TEST(GameModeMachineTests, LegalEdges) {
    EXPECT_TRUE(GameModeMachine::IsLegal(GameMode::Menu, GameMode::Playing));
    EXPECT_TRUE(GameModeMachine::IsLegal(GameMode::Playing, GameMode::Paused));
    EXPECT_TRUE(GameModeMachine::IsLegal(GameMode::Playing, GameMode::EraTransition));
    EXPECT_TRUE(GameModeMachine::IsLegal(GameMode::Paused, GameMode::Playing));
    EXPECT_TRUE(GameModeMachine::IsLegal(GameMode::Paused, GameMode::Menu));
    EXPECT_TRUE(GameModeMachine::IsLegal(GameMode::EraTransition, GameMode::Playing));

    int legal = 0;
    for (GameMode from : kModes)
        for (GameMode to : kModes)
            legal += GameModeMachine::IsLegal(from, to) ? 1 : 0;
    EXPECT_EQ(legal, 6);
}

TEST(GameModeMachineTests, PausedOnlyReachableFromPlaying) {
    EXPECT_FALSE(GameModeMachine::IsLegal(GameMode::Menu, GameMode::Paused));
    EXPECT_FALSE(GameModeMachine::IsLegal(GameMode::EraTransition, GameMode::Paused));
    EXPECT_FALSE(GameModeMachine::IsLegal(GameMode::Menu, GameMode::EraTransition));
    EXPECT_FALSE(GameModeMachine::IsLegal(GameMode::EraTransition, GameMode::Menu));
}

TEST(GameModeMachineTests, InitialModeIsEntered) {
    Recorder rec;
    GameModeMachine machine(MakeHandlers(rec), GameMode::Menu);
    EXPECT_EQ(machine.current(), GameMode::Menu);
    ASSERT_EQ(rec.entered.size(), 1u);
    EXPECT_EQ(rec.entered[0], GameMode::Menu);
}

TEST(GameModeMachineTests, IllegalTransitionIsRefused) {
    Recorder rec;
    GameModeMachine machine(MakeHandlers(rec), GameMode::Menu);
    EXPECT_FALSE(machine.transitionTo(GameMode::Paused));
    EXPECT_EQ(machine.current(), GameMode::Menu);
    EXPECT_EQ(rec.entered.size(), 1u);
}

TEST(GameModeMachineTests, HandlerRequestsAreApplied) {
    Recorder rec;
    GameModeMachine machine(MakeHandlers(rec), GameMode::Menu);

    rec.nextRequest = GameMode::Playing;
    machine.update(16.0f);
    EXPECT_EQ(machine.current(), GameMode::Playing);
    EXPECT_EQ(rec.updates[static_cast<int>(GameMode::Menu)], 1);

    machine.update(16.0f);
    EXPECT_EQ(rec.updates[static_cast<int>(GameMode::Playing)], 1);

    // pedido ilegal vindo do handler: ignorado
    rec.nextRequest = GameMode::Menu;
    machine.update(16.0f);
    EXPECT_EQ(machine.current(), GameMode::Playing);

    ASSERT_EQ(rec.entered.size(), 2u);
    EXPECT_EQ(rec.entered[1], GameMode::Playing);
}

TEST(GameModeMachineTests, OnlyActiveModeDraws) {
    Recorder rec;
    GameModeMachine machine(MakeHandlers(rec), GameMode::Menu);
    machine.transitionTo(GameMode::Playing);
    machine.transitionTo(GameMode::Paused);

    CommandBuffer cmds;
    DrawContext ctx{cmds};
    machine.draw(ctx);
    EXPECT_EQ(rec.draws[static_cast<int>(GameMode::Paused)], 1);
    EXPECT_EQ(rec.draws[static_cast<int>(GameMode::Playing)], 0);
    EXPECT_EQ(rec.draws[static_cast<int>(GameMode::Menu)], 0);
}

TEST(GameModeMachineTests, MissingHandlersAreSkipped) {
    std::array<ModeHandlers, kGameModeCount> empty;
    GameModeMachine machine(empty, GameMode::Menu);

    InputEvent event;
    event.key = Key::Return;
    machine.handleInput(event);
    machine.update(16.0f);
    EXPECT_EQ(machine.current(), GameMode::Menu);
    EXPECT_TRUE(machine.transitionTo(GameMode::Playing));
}

TEST(GameModeMachineTests, NamesAreStable) {
    EXPECT_STREQ(GameModeName(GameMode::Menu), "Menu");
    EXPECT_STREQ(GameModeName(GameMode::EraTransition), "EraTransition");
}

} // namespace
