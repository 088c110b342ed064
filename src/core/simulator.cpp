/**
 * @fileoverview simulator.cpp
 * @brief Implementation of Simulator.
 */

#include "relativity/core/simulator.hpp"

#include <utility>

#include "relativity/components/basic.hpp"
#include "relativity/core/constants.hpp"
#include "relativity/core/debug.hpp"
#include "relativity/core/profile.hpp"
#include "relativity/physics/launch.hpp"
#include "relativity/systems/gravity.hpp"
#include "relativity/systems/movement.hpp"
#include "relativity/systems/time_dilation.hpp"
#include "relativity/systems/trail.hpp"

using Simulation::AppState;
using Simulation::GameState;

Simulator::Simulator(const SystemConfig& cfg)
    : Simulator(cfg, std::make_unique<LevelManager>())
{
}

Simulator::Simulator(const SystemConfig& cfg, std::unique_ptr<LevelManager> levels)
    : config(cfg),
      coords(cfg, RelativityConstants::ScreenWidthMeters),
      levels(std::move(levels))
{
}

void Simulator::spawnLevel() {
    registry.clear();
    failureTimer = 0.0;
    outcome = Systems::Outcome::None;
    KinematicsStats::reset();

    try {
        levels->current().createEntities(registry, coords);
    } catch (...) {
        registry.clear();
        throw;
    }

    // Initial gammas so the HUD is correct before launch
    Systems::TimeDilationSystem::update(registry, 0.0);

    INFO_MSG("Loaded " << levels->current().name());
}

void Simulator::resetLevel() {
    spawnLevel();
    if (states.game() != GameState::Paused) {
        states.transition(GameState::Paused);
    }
}

void Simulator::enterGame() {
    if (states.app() == AppState::InGame) {
        return;
    }
    spawnLevel();
    states.transition(AppState::InGame);
}

void Simulator::exitToMenu() {
    if (states.app() == AppState::Menu) {
        return;
    }
    KinematicsStats::print();
    registry.clear();
    outcome = Systems::Outcome::None;
    failureTimer = 0.0;
    states.transition(AppState::Menu);
}

bool Simulator::launch(const Vector& direction, double power) {
    return launchWithVelocity(Physics::launchVelocity(direction, power));
}

bool Simulator::launchWithVelocity(const Vector& velocity) {
    if (states.app() != AppState::InGame || states.game() != GameState::Paused) {
        return false;
    }

    entt::entity const p = player();
    if (p == entt::null) {
        return false;
    }

    Vector v = velocity;
    double const maxSpeed = RelativityConstants::SpeedClampFraction * RelativityConstants::C;
    if (v.length() >= maxSpeed) {
        WARN_MSG("[Simulator] launch speed " << RelativityConstants::speedFractionOfC(v.length())
                 << "c clamped to " << RelativityConstants::SpeedClampFraction << "c");
        v = v.scale(maxSpeed);
    }

    registry.get<Components::Velocity>(p) = v;
    registry.emplace_or_replace<Components::Launched>(p);

    DEBUG_MSG("Launch at " << RelativityConstants::speedFractionOfC(v.length()) << "c");
    return states.transition(GameState::Running);
}

bool Simulator::togglePause() {
    if (states.app() != AppState::InGame) {
        return false;
    }
    if (states.game() == GameState::Running) {
        return states.transition(GameState::SimPaused);
    }
    if (states.game() == GameState::SimPaused) {
        return states.transition(GameState::Running);
    }
    return false;
}

bool Simulator::increaseRate() {
    if (!states.isRunning()) {
        return false;
    }
    rate.increase();
    return true;
}

bool Simulator::decreaseRate() {
    if (!states.isRunning()) {
        return false;
    }
    rate.decrease();
    return true;
}

bool Simulator::resetRate() {
    if (!states.isRunning()) {
        return false;
    }
    rate.reset();
    return true;
}

void Simulator::retry() {
    if (states.app() != AppState::InGame) {
        return;
    }
    resetLevel();
}

void Simulator::advanceLevel() {
    if (states.app() != AppState::InGame) {
        return;
    }
    if (!levels->next()) {
        INFO_MSG("All levels complete");
        exitToMenu();
        return;
    }
    resetLevel();
}

void Simulator::applyOutcome(Systems::Outcome result) {
    outcome = result;
    if (result == Systems::Outcome::None) {
        return;
    }

    auto const r = readout();
    INFO_MSG(levels->current().name() << " " << Systems::outcomeName(result)
             << ": t_p = " << RelativityConstants::secondsToDays(r.playerClock)
             << " d, t_o = " << RelativityConstants::secondsToDays(r.observerClock) << " d");

    states.transition(result == Systems::Outcome::Finished ? GameState::Finished : GameState::Failed);
    failureTimer = 0.0;
}

Systems::Outcome Simulator::tick(double realSeconds) {
    PROFILE_SCOPE("Simulator::tick");

    if (states.app() != AppState::InGame) {
        return Systems::Outcome::None;
    }

    if (states.game() == GameState::Failed) {
        if (realSeconds > 0.0) {
            failureTimer += realSeconds;
        }
        if (failureTimer >= config.FailureResetSeconds) {
            resetLevel();
        }
        return Systems::Outcome::None;
    }

    if (states.game() != GameState::Running) {
        return Systems::Outcome::None;
    }

    double const dt = Simulation::elapsedSimulationTime(realSeconds, rate.value(), config.SecondsPerRealSecond);

    Systems::GravitySystem::update(registry, dt);
    Systems::MovementSystem::update(registry, dt);
    Systems::TimeDilationSystem::update(registry, dt);
    Systems::ObserverClockSystem::update(registry, dt);

    Systems::Outcome const result = Systems::CollisionSystem::check(registry);
    Systems::TrailSystem::update(registry, coords);

    applyOutcome(result);
    return result;
}

entt::entity Simulator::player() const {
    auto view = registry.view<const Components::Player>();
    return view.empty() ? entt::entity{entt::null} : view.front();
}

PlayerReadout Simulator::readout() const {
    PlayerReadout r;

    auto players = registry.view<const Components::Player, const Components::Velocity, const Components::Clock,
                                 const Components::VelocityGamma, const Components::GravitationalGamma>();
    for (auto [entity, vel, clock, gammaV, gammaG] : players.each()) {
        r.playerClock = clock.value;
        r.velocityGamma = gammaV.value;
        r.gravitationalGamma = gammaG.value;
        r.speed = vel.length();
    }

    auto observers = registry.view<const Components::Observer, const Components::Clock>();
    for (auto [entity, clock] : observers.each()) {
        r.observerClock = clock.value;
    }
    return r;
}

std::vector<Physics::MassSample> Simulator::masses() const {
    return Systems::GravitySystem::collectMasses(registry);
}
