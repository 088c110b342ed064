#include <gtest/gtest.h>

#include <set>
#include <utility>

#include "relativity/core/game_state.hpp"

using namespace Simulation;

TEST(GameStateTest, OnlyListedEdgesAreLegal) {
    const GameState all[] = {GameState::Paused, GameState::Running, GameState::SimPaused,
                             GameState::Finished, GameState::Failed};

    const std::set<std::pair<GameState, GameState>> legal = {
        {GameState::Paused, GameState::Running},
        {GameState::Running, GameState::SimPaused},
        {GameState::SimPaused, GameState::Running},
        {GameState::Running, GameState::Finished},
        {GameState::Running, GameState::Failed},
        {GameState::Failed, GameState::Paused},
        {GameState::Finished, GameState::Paused},
        {GameState::Running, GameState::Paused},
        {GameState::SimPaused, GameState::Paused},
    };

    for (GameState from : all) {
        for (GameState to : all) {
            bool const expected = legal.count({from, to}) > 0;
            EXPECT_EQ(canTransition(from, to), expected)
                << stateName(from) << " -> " << stateName(to);
        }
    }
}

TEST(GameStateTest, MachineStartsInMenuPaused) {
    GameStateMachine machine;
    EXPECT_EQ(machine.app(), AppState::Menu);
    EXPECT_EQ(machine.game(), GameState::Paused);
    EXPECT_FALSE(machine.isRunning());
}

TEST(GameStateTest, IllegalTransitionKeepsState) {
    GameStateMachine machine;
    EXPECT_FALSE(machine.transition(GameState::Finished));
    EXPECT_EQ(machine.game(), GameState::Paused);

    EXPECT_TRUE(machine.transition(GameState::Running));
    EXPECT_FALSE(machine.transition(GameState::Running));
    EXPECT_EQ(machine.game(), GameState::Running);
}

TEST(GameStateTest, FullAttemptCycle) {
    GameStateMachine machine;
    ASSERT_TRUE(machine.transition(AppState::InGame));
    EXPECT_TRUE(machine.transition(GameState::Running));
    EXPECT_TRUE(machine.isRunning());
    EXPECT_TRUE(machine.transition(GameState::SimPaused));
    EXPECT_FALSE(machine.isRunning());
    EXPECT_TRUE(machine.transition(GameState::Running));
    EXPECT_TRUE(machine.transition(GameState::Failed));
    EXPECT_FALSE(machine.transition(GameState::Running));
    EXPECT_TRUE(machine.transition(GameState::Paused));
}

TEST(GameStateTest, AppTransitionResetsGameState) {
    GameStateMachine machine;
    ASSERT_TRUE(machine.transition(AppState::InGame));
    ASSERT_TRUE(machine.transition(GameState::Running));

    EXPECT_TRUE(machine.transition(AppState::Menu));
    EXPECT_EQ(machine.game(), GameState::Paused);
    EXPECT_FALSE(machine.transition(AppState::Menu));
}

TEST(GameStateTest, RunningRequiresInGame) {
    GameStateMachine machine;
    ASSERT_TRUE(machine.transition(GameState::Running));
    EXPECT_FALSE(machine.isRunning());
}
