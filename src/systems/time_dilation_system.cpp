/**
 * @file time_dilation_system.cpp
 * @brief Player proper time and observer coordinate time
 */

#include "relativity/systems/time_dilation.hpp"

#include "relativity/components/basic.hpp"
#include "relativity/core/profile.hpp"
#include "relativity/physics/lorentz.hpp"
#include "relativity/systems/gravity.hpp"

namespace Systems {

void TimeDilationSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("TimeDilationSystem");

    auto view = registry.view<Components::Player,
                              Components::Position,
                              Components::Velocity,
                              Components::VelocityGamma,
                              Components::GravitationalGamma,
                              Components::Clock>();

    for (auto [entity, pos, vel, gammaV, gammaG, clock] : view.each()) {
        auto const masses = GravitySystem::collectMasses(registry, entity);

        gammaV.value = Physics::velocityGamma(vel.length());
        gammaG.value = Physics::gravitationalGamma(pos, masses);
        clock.value = Physics::advanceProperTime(clock.value, dt, gammaV.value, gammaG.value);
    }
}

void ObserverClockSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("ObserverClockSystem");

    if (dt <= 0.0) {
        return;
    }

    auto view = registry.view<Components::Observer, Components::Clock>();
    for (auto [entity, clock] : view.each()) {
        clock.value += dt;
    }
}

} // namespace Systems
