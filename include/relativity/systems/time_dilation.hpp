/**
 * @file time_dilation.hpp
 * @brief Gamma recomputation and clock advance for the player and observer
 *
 * TimeDilationSystem:
 * - recomputes VelocityGamma and GravitationalGamma on the player
 * - advances the player Clock by dt / (gamma_v * gamma_g)
 *
 * ObserverClockSystem:
 * - advances the observer Clock by dt
 *
 * Both return silently when their entity is missing.
 */

#ifndef RELATIVITY_TIME_DILATION_SYSTEM_HPP
#define RELATIVITY_TIME_DILATION_SYSTEM_HPP

#include <entt/entt.hpp>

namespace Systems {

class TimeDilationSystem {
public:
    static void update(entt::registry& registry, double dt);
};

class ObserverClockSystem {
public:
    static void update(entt::registry& registry, double dt);
};

} // namespace Systems

#endif // RELATIVITY_TIME_DILATION_SYSTEM_HPP
