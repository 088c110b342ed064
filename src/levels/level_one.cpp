#include "relativity/levels/level_one.hpp"

#include "relativity/core/constants.hpp"
#include "relativity/levels/level_entities.hpp"

void LevelOne::createEntities(entt::registry& registry, const Simulation::Coordinates& coords) const {
    using namespace RelativityConstants;

    Levels::spawnObserver(registry);
    Levels::spawnPlayer(registry, coords, 0.3, 0.3, UnitRadius / 4.0);

    Levels::spawnPlanet(registry, coords, {"sun", 0.5, 0.5, 3.0 * UnitRadius, MassOfSun, {255, 200, 60}});
    Levels::spawnPlanet(registry, coords, {"sun2", 0.8, 0.7, 2.0 * UnitRadius, 0.4 * MassOfSun, {255, 140, 60}});
    Levels::spawnPlanet(registry, coords, {"earth", 0.28, 0.28, 2.0 * UnitRadius, MassOfEarth, {70, 130, 220}});

    Levels::spawnDestination(registry, coords, {"destination", 0.9, 0.9, 4.0 * UnitRadius, 0.6 * MassOfSun, {120, 230, 140}});
}
