#pragma once

#include "relativity/levels/i_level.hpp"

/**
 * @struct LevelTwoConfig
 * @brief Layout parameters for the moving-obstacle level
 */
struct LevelTwoConfig {
    // Player start, screen fractions
    double playerX = 0.1;
    double playerY = 0.85;

    // Drifting planet
    double driftX = 0.55;
    double driftY = 0.2;
    double driftSpeedKms = 30000.0; // along +y

    // Destination, screen fractions
    double destinationX = 0.92;
    double destinationY = 0.15;
};

/**
 * @class LevelTwo
 *
 * A central sun and a planet drifting across the path to the destination.
 * The drifting planet is integrated like the player once the level runs.
 */
class LevelTwo : public ILevel {
public:
    LevelTwo() = default;
    ~LevelTwo() override = default;

    std::string name() const override { return "Level 2"; }
    void createEntities(entt::registry& registry, const Simulation::Coordinates& coords) const override;

private:
    LevelTwoConfig levelConfig;
};
