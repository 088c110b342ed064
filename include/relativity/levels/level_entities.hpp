/**
 * @file level_entities.hpp
 * @brief Factory helpers shared by all levels
 *
 * Positions are screen fractions, converted through Coordinates. Every
 * helper validates its body and throws std::invalid_argument on a
 * non-positive radius or a negative mass.
 */

#ifndef RELATIVITY_LEVEL_ENTITIES_HPP
#define RELATIVITY_LEVEL_ENTITIES_HPP

#include <entt/entt.hpp>

#include "relativity/components/basic.hpp"
#include "relativity/core/coordinates.hpp"

namespace Levels {

/**
 * @brief Description of one body in a level layout
 */
struct BodyDef {
    const char* label;
    double fx;        // screen fraction
    double fy;        // screen fraction
    double radius;    // meters
    double mass;      // kg
    Components::Color color;
};

/** @throws std::invalid_argument */
void validateBody(const char* label, double radius, double mass);

entt::entity spawnPlayer(entt::registry& registry, const Simulation::Coordinates& coords,
                         double fx, double fy, double radius);

entt::entity spawnObserver(entt::registry& registry);

entt::entity spawnPlanet(entt::registry& registry, const Simulation::Coordinates& coords, const BodyDef& body);

/**
 * @brief A planet integrated by the same systems as the player
 * @param velocity Initial velocity in m/s
 */
entt::entity spawnDynamicPlanet(entt::registry& registry, const Simulation::Coordinates& coords,
                                const BodyDef& body, const Vector& velocity);

entt::entity spawnDestination(entt::registry& registry, const Simulation::Coordinates& coords, const BodyDef& body);

} // namespace Levels

#endif // RELATIVITY_LEVEL_ENTITIES_HPP
