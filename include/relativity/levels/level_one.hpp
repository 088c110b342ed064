#pragma once

#include "relativity/levels/i_level.hpp"

/**
 * @class LevelOne
 *
 * Two suns between the start and the destination, with an Earth-mass
 * planet just behind the player. A straight shot at the destination
 * runs into the first sun.
 */
class LevelOne : public ILevel {
public:
    LevelOne() = default;
    ~LevelOne() override = default;

    std::string name() const override { return "Level 1"; }
    void createEntities(entt::registry& registry, const Simulation::Coordinates& coords) const override;
};
