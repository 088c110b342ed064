/**
 * @file game_state.hpp
 * @brief Application and gameplay state machines
 *
 * GameState edges:
 * - Paused -> Running (launch)
 * - Running <-> SimPaused (pause toggle)
 * - Running -> Finished | Failed (collision outcome)
 * - Failed -> Paused (auto reset)
 * - Finished -> Paused (retry or next level)
 * - Running | SimPaused -> Paused (explicit reset)
 */

#pragma once

namespace Simulation {

enum class AppState {
    Menu,
    InGame
};

enum class GameState {
    Paused,
    Running,
    SimPaused,
    Finished,
    Failed
};

const char* stateName(AppState state);
const char* stateName(GameState state);

/**
 * @brief True when from -> to is a legal edge
 */
bool canTransition(GameState from, GameState to);
bool canTransition(AppState from, AppState to);

/**
 * @class GameStateMachine
 * @brief Holds the current states and rejects illegal transitions
 */
class GameStateMachine {
public:
    AppState app() const { return appState; }
    GameState game() const { return gameState; }

    /**
     * @brief Applies a legal transition
     * @return false (state unchanged, warning logged) when illegal
     */
    bool transition(GameState to);
    bool transition(AppState to);

    /** @brief True only when simulated time advances */
    bool isRunning() const { return appState == AppState::InGame && gameState == GameState::Running; }

private:
    AppState appState = AppState::Menu;
    GameState gameState = GameState::Paused;
};

} // namespace Simulation
