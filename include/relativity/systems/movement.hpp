/**
 * @file movement.hpp
 * @brief System for updating positions based on velocity
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 * - Launched
 */

#ifndef RELATIVITY_MOVEMENT_SYSTEM_HPP
#define RELATIVITY_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>

namespace Systems {

/**
 * @brief Updates positions of launched bodies according to their velocity
 *
 * Runs after GravitySystem so every position advances with its final
 * velocity for the tick.
 */
class MovementSystem {
public:
    static void update(entt::registry& registry, double dt);
};

} // namespace Systems

#endif // RELATIVITY_MOVEMENT_SYSTEM_HPP
