#include "relativity/levels/level_entities.hpp"

#include <sstream>
#include <stdexcept>

#include "relativity/core/debug.hpp"

namespace Levels {

void validateBody(const char* label, double radius, double mass) {
    if (!(radius > 0.0)) {
        std::ostringstream msg;
        msg << "Body '" << label << "' has non-positive radius " << radius;
        throw std::invalid_argument(msg.str());
    }
    if (!(mass >= 0.0)) {
        std::ostringstream msg;
        msg << "Body '" << label << "' has negative mass " << mass;
        throw std::invalid_argument(msg.str());
    }
}

entt::entity spawnPlayer(entt::registry& registry, const Simulation::Coordinates& coords,
                         double fx, double fy, double radius) {
    validateBody("player", radius, 0.0);

    auto player = registry.create();
    registry.emplace<Components::Player>(player);
    registry.emplace<Components::Position>(player, coords.fractionToWorld(fx, fy));
    registry.emplace<Components::Velocity>(player, 0.0, 0.0);
    registry.emplace<Components::Radius>(player, radius);
    registry.emplace<Components::Clock>(player);
    registry.emplace<Components::VelocityGamma>(player);
    registry.emplace<Components::GravitationalGamma>(player);
    registry.emplace<Components::TrailBuffer>(player);
    registry.emplace<Components::Color>(player, 230, 240, 255);
    registry.emplace<Components::Label>(player, "player");
    return player;
}

entt::entity spawnObserver(entt::registry& registry) {
    auto observer = registry.create();
    registry.emplace<Components::Observer>(observer);
    registry.emplace<Components::Clock>(observer);
    return observer;
}

namespace {

    entt::entity spawnBody(entt::registry& registry, const Simulation::Coordinates& coords, const BodyDef& body) {
        validateBody(body.label, body.radius, body.mass);

        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, coords.fractionToWorld(body.fx, body.fy));
        registry.emplace<Components::Radius>(entity, body.radius);
        registry.emplace<Components::Mass>(entity, body.mass);
        registry.emplace<Components::Color>(entity, body.color);
        registry.emplace<Components::Label>(entity, body.label);
        return entity;
    }

} // namespace

entt::entity spawnPlanet(entt::registry& registry, const Simulation::Coordinates& coords, const BodyDef& body) {
    auto planet = spawnBody(registry, coords, body);
    registry.emplace<Components::Planet>(planet);
    DEBUG_MSG("Spawned planet " << body.label);
    return planet;
}

entt::entity spawnDynamicPlanet(entt::registry& registry, const Simulation::Coordinates& coords,
                                const BodyDef& body, const Vector& velocity) {
    auto planet = spawnPlanet(registry, coords, body);
    registry.emplace<Components::Velocity>(planet, velocity);
    registry.emplace<Components::Launched>(planet);
    return planet;
}

entt::entity spawnDestination(entt::registry& registry, const Simulation::Coordinates& coords, const BodyDef& body) {
    auto destination = spawnBody(registry, coords, body);
    registry.emplace<Components::Destination>(destination);
    DEBUG_MSG("Spawned destination " << body.label);
    return destination;
}

} // namespace Levels
