#include "relativity/systems/movement.hpp"

#include "relativity/components/basic.hpp"
#include "relativity/core/profile.hpp"

namespace Systems {

void MovementSystem::update(entt::registry& registry, double dt) {
    PROFILE_SCOPE("MovementSystem");

    if (dt <= 0.0) {
        return;
    }

    auto view = registry.view<Components::Position, Components::Velocity, Components::Launched>();
    for (auto [entity, pos, vel] : view.each()) {
        pos.x += vel.x * dt;
        pos.y += vel.y * dt;
    }
}

} // namespace Systems
