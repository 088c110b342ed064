/**
 * @file gravity_system.cpp
 * @brief Implementation of the field-driven velocity update
 */

#include "relativity/systems/gravity.hpp"

#include "relativity/components/basic.hpp"
#include "relativity/core/constants.hpp"
#include "relativity/core/debug.hpp"
#include "relativity/core/profile.hpp"

namespace Systems {

std::vector<Physics::MassSample> GravitySystem::collectMasses(const entt::registry& registry,
                                                              entt::entity exclude) {
    std::vector<Physics::MassSample> masses;
    auto view = registry.view<const Components::Position, const Components::Mass>();
    for (auto [entity, pos, mass] : view.each()) {
        if (entity == exclude) {
            continue;
        }
        masses.push_back({pos, mass.value});
    }
    return masses;
}

void GravitySystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("GravitySystem");

    if (dt <= 0.0) {
        return;
    }

    // Snapshot of every massive body before any velocity changes
    struct Source {
        entt::entity entity;
        Physics::MassSample sample;
    };
    std::vector<Source> sources;
    {
        auto massView = registry.view<Components::Position, Components::Mass>();
        for (auto [entity, pos, mass] : massView.each()) {
            sources.push_back({entity, {pos, mass.value}});
        }
    }

    double const maxSpeed = RelativityConstants::SpeedClampFraction * RelativityConstants::C;

    std::vector<Physics::MassSample> others;
    others.reserve(sources.size());

    auto view = registry.view<Components::Position, Components::Velocity, Components::Launched>();
    for (auto [entity, pos, vel] : view.each()) {
        others.clear();
        for (const auto& src : sources) {
            if (src.entity != entity) {
                others.push_back(src.sample);
            }
        }

        Physics::FieldSample const field = Physics::computeFieldAtPoint(pos, others);
        vel += field.acceleration * dt;

        bool const isPlayer = registry.all_of<Components::Player>(entity);

        double const speed = vel.length();
        if (speed >= maxSpeed) {
            WARN_MSG("[GravitySystem] speed " << RelativityConstants::speedFractionOfC(speed)
                     << "c clamped to " << RelativityConstants::SpeedClampFraction << "c");
            vel = vel.scale(maxSpeed);
            if (isPlayer) {
                KinematicsStats::recordClamp();
            }
        }
        if (isPlayer) {
            KinematicsStats::recordSpeed(RelativityConstants::speedFractionOfC(vel.length()));
        }
    }
}

} // namespace Systems
