#ifndef RELATIVITY_I_LEVEL_HPP
#define RELATIVITY_I_LEVEL_HPP

#include <string>

#include <entt/entt.hpp>

#include "relativity/core/coordinates.hpp"

/**
 * @brief Abstract base class for a playable level
 *
 * Each level must provide:
 *  - name() for the HUD and logs
 *  - createEntities() that spawns the player, observer clock, obstacles
 *    and destination
 */
class ILevel {
public:
    virtual ~ILevel() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Creates level entities in the registry
     * @throws std::invalid_argument if a body has a non-positive radius or negative mass
     */
    virtual void createEntities(entt::registry& registry, const Simulation::Coordinates& coords) const = 0;
};

#endif // RELATIVITY_I_LEVEL_HPP
