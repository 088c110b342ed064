/**
 * @file trail.hpp
 * @brief Records the player's path as screen-space samples colored by gamma
 *
 * Required components:
 * - Player, Position, VelocityGamma, GravitationalGamma, TrailBuffer
 *
 * Samples are colored by the total dilation gamma_v * gamma_g.
 */

#ifndef RELATIVITY_TRAIL_SYSTEM_HPP
#define RELATIVITY_TRAIL_SYSTEM_HPP

#include <entt/entt.hpp>

#include "relativity/components/basic.hpp"
#include "relativity/core/coordinates.hpp"

namespace Systems {

class TrailSystem {
public:
    /**
     * @brief Appends the player's current screen position and color
     *
     * Evicts the oldest samples beyond TrailBuffer::Capacity.
     */
    static void update(entt::registry& registry, const Simulation::Coordinates& coords);

    /** @brief Empties every trail buffer */
    static void clear(entt::registry& registry);

    /**
     * @brief Appends one sample to a buffer, evicting the oldest when full
     */
    static void push(Components::TrailBuffer& trail, const Position& point, const Components::Color& color);
};

} // namespace Systems

#endif // RELATIVITY_TRAIL_SYSTEM_HPP
