#include "relativity/core/game_state.hpp"

#include "relativity/core/debug.hpp"

namespace Simulation {

const char* stateName(AppState state) {
    switch (state) {
        case AppState::Menu:   return "Menu";
        case AppState::InGame: return "InGame";
    }
    return "Unknown";
}

const char* stateName(GameState state) {
    switch (state) {
        case GameState::Paused:    return "Paused";
        case GameState::Running:   return "Running";
        case GameState::SimPaused: return "SimPaused";
        case GameState::Finished:  return "Finished";
        case GameState::Failed:    return "Failed";
    }
    return "Unknown";
}

bool canTransition(GameState from, GameState to) {
    switch (from) {
        case GameState::Paused:
            return to == GameState::Running;
        case GameState::Running:
            return to == GameState::SimPaused || to == GameState::Finished ||
                   to == GameState::Failed || to == GameState::Paused;
        case GameState::SimPaused:
            return to == GameState::Running || to == GameState::Paused;
        case GameState::Finished:
        case GameState::Failed:
            return to == GameState::Paused;
    }
    return false;
}

bool canTransition(AppState from, AppState to) {
    return from != to;
}

bool GameStateMachine::transition(GameState to) {
    if (!canTransition(gameState, to)) {
        WARN_MSG("[GameState] rejected " << stateName(gameState) << " -> " << stateName(to));
        return false;
    }
    DEBUG_MSG("[GameState] " << stateName(gameState) << " -> " << stateName(to));
    gameState = to;
    return true;
}

bool GameStateMachine::transition(AppState to) {
    if (!canTransition(appState, to)) {
        WARN_MSG("[AppState] rejected " << stateName(appState) << " -> " << stateName(to));
        return false;
    }
    DEBUG_MSG("[AppState] " << stateName(appState) << " -> " << stateName(to));
    appState = to;
    // Entering or leaving a level always starts from aiming
    gameState = GameState::Paused;
    return true;
}

} // namespace Simulation
