#include "relativity/levels/level_two.hpp"

#include "relativity/core/constants.hpp"
#include "relativity/levels/level_entities.hpp"

void LevelTwo::createEntities(entt::registry& registry, const Simulation::Coordinates& coords) const {
    using namespace RelativityConstants;
    const auto& cfg = levelConfig;

    Levels::spawnObserver(registry);
    Levels::spawnPlayer(registry, coords, cfg.playerX, cfg.playerY, UnitRadius / 4.0);

    Levels::spawnPlanet(registry, coords, {"sun", 0.45, 0.55, 3.0 * UnitRadius, MassOfSun, {255, 200, 60}});

    Vector const drift(0.0, kmPerSecondToMetersPerSecond(cfg.driftSpeedKms));
    Levels::spawnDynamicPlanet(registry, coords,
                               {"drifter", cfg.driftX, cfg.driftY, 1.5 * UnitRadius, 10.0 * MassOfEarth, {180, 110, 220}},
                               drift);

    Levels::spawnDestination(registry, coords,
                             {"destination", cfg.destinationX, cfg.destinationY, 4.0 * UnitRadius, 0.6 * MassOfSun, {120, 230, 140}});
}
