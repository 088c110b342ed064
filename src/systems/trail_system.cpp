#include "relativity/systems/trail.hpp"

#include "relativity/core/profile.hpp"
#include "relativity/visuals/color_map.hpp"

namespace Systems {

void TrailSystem::push(Components::TrailBuffer& trail, const Position& point, const Components::Color& color) {
    trail.points.emplace_back(point, color);
    while (trail.points.size() > Components::TrailBuffer::Capacity) {
        trail.points.pop_front();
    }
}

void TrailSystem::update(entt::registry& registry, const Simulation::Coordinates& coords) {
    PROFILE_SCOPE("TrailSystem");

    auto view = registry.view<Components::Player,
                              Components::Position,
                              Components::VelocityGamma,
                              Components::GravitationalGamma,
                              Components::TrailBuffer>();

    for (auto [entity, pos, gammaV, gammaG, trail] : view.each()) {
        double const totalGamma = gammaV.value * gammaG.value;
        push(trail, coords.worldToScreen(pos), Visuals::toColor(Visuals::gammaToColor(totalGamma)));
    }
}

void TrailSystem::clear(entt::registry& registry) {
    auto view = registry.view<Components::TrailBuffer>();
    for (auto [entity, trail] : view.each()) {
        trail.points.clear();
    }
}

} // namespace Systems
