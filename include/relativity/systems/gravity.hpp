/**
 * @file gravity.hpp
 * @brief Velocity update from the gravitational field of all massive bodies
 *
 * Required components:
 * - Position, Velocity (to modify), Launched
 *
 * Sources:
 * - every entity with Position and Mass other than the body itself
 */

#ifndef RELATIVITY_GRAVITY_SYSTEM_HPP
#define RELATIVITY_GRAVITY_SYSTEM_HPP

#include <vector>

#include <entt/entt.hpp>

#include "relativity/physics/gravity_field.hpp"

namespace Systems {

/**
 * @class GravitySystem
 * @brief Applies v += a * dt to launched bodies
 *
 * Mass positions are read from a snapshot taken before any velocity is
 * written, so the result does not depend on iteration order. Speeds that
 * would reach c are clamped to SpeedClampFraction of c.
 */
class GravitySystem {
public:
    /**
     * @param registry EnTT registry containing entities and components
     * @param dt Simulated seconds for this tick
     */
    static void update(entt::registry& registry, double dt);

    /**
     * @brief All massive bodies in the registry, excluding one entity
     */
    static std::vector<Physics::MassSample> collectMasses(const entt::registry& registry,
                                                          entt::entity exclude = entt::null);
};

} // namespace Systems

#endif // RELATIVITY_GRAVITY_SYSTEM_HPP
