/**
 * @file simulator.hpp
 * @brief Owns the ECS registry, the state machines and the per-tick pipeline.
 */

#pragma once

#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "relativity/core/coordinates.hpp"
#include "relativity/core/game_state.hpp"
#include "relativity/core/sim_time.hpp"
#include "relativity/core/system_config.hpp"
#include "relativity/levels/level_manager.hpp"
#include "relativity/physics/gravity_field.hpp"
#include "relativity/systems/collision.hpp"

/**
 * @struct PlayerReadout
 * @brief Snapshot of the values shown on the HUD
 */
struct PlayerReadout {
    double playerClock = 0.0;   // seconds
    double observerClock = 0.0; // seconds
    double velocityGamma = 1.0;
    double gravitationalGamma = 1.0;
    double speed = 0.0;         // m/s
};

/**
 * @class Simulator
 * @brief World context for one game session.
 *
 * tick() runs only while Running, in this order:
 * gravity (velocity) -> movement (position) -> gammas and player clock ->
 * observer clock -> collision -> trail.
 * In the Failed state it instead counts real time toward the automatic
 * reset.
 */
class Simulator {
public:
    explicit Simulator(const SystemConfig& cfg = defaultSystemConfig());
    Simulator(const SystemConfig& cfg, std::unique_ptr<LevelManager> levels);

    /**
     * @brief Menu -> InGame, spawning the current level
     * @throws std::invalid_argument if the level data is invalid
     */
    void enterGame();

    /** @brief InGame -> Menu, despawning every level entity */
    void exitToMenu();

    /**
     * @brief Fires the player along direction at the given raw power
     * @return false unless in game and Paused
     */
    bool launch(const Vector& direction, double power);

    /**
     * @brief Fires the player with an explicit velocity in m/s
     *
     * Speeds at or above SpeedClampFraction of c are clamped.
     * @return false unless in game and Paused
     */
    bool launchWithVelocity(const Vector& velocity);

    /** @brief Running <-> SimPaused */
    bool togglePause();

    /** @brief Rate changes are accepted only while Running */
    bool increaseRate();
    bool decreaseRate();
    bool resetRate();

    /** @brief Respawns the current level and returns to Paused */
    void retry();

    /**
     * @brief Spawns the next level Paused, or returns to the menu after the
     * last one
     */
    void advanceLevel();

    /**
     * @brief Advances the session by a frame of real time
     * @return The collision outcome of this tick
     */
    Systems::Outcome tick(double realSeconds);

    Systems::Outcome lastOutcome() const { return outcome; }

    Simulation::GameState gameState() const { return states.game(); }
    Simulation::AppState appState() const { return states.app(); }
    const Simulation::SimRate& simRate() const { return rate; }
    const LevelManager& getLevels() const { return *levels; }
    const Simulation::Coordinates& getCoordinates() const { return coords; }
    const SystemConfig& getConfig() const { return config; }

    /** @brief Real seconds spent in the Failed state so far */
    double failureElapsed() const { return failureTimer; }

    /** @brief The player entity, or entt::null when no level is loaded */
    entt::entity player() const;

    PlayerReadout readout() const;

    /** @brief Every massive body, for the gravity grid */
    std::vector<Physics::MassSample> masses() const;

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    void spawnLevel();
    void resetLevel();
    void applyOutcome(Systems::Outcome result);

    SystemConfig config;
    Simulation::Coordinates coords;
    std::unique_ptr<LevelManager> levels;
    entt::registry registry;
    Simulation::GameStateMachine states;
    Simulation::SimRate rate;
    Systems::Outcome outcome = Systems::Outcome::None;
    double failureTimer = 0.0;
};
