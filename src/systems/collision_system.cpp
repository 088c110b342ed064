#include "relativity/systems/collision.hpp"

#include "relativity/components/basic.hpp"
#include "relativity/core/profile.hpp"

namespace Systems {

bool hasCollided(const Position& p1, double r1, const Position& p2, double r2) {
    return p1.dist(p2) <= r1 + r2;
}

Outcome CollisionSystem::check(const entt::registry& registry) {
    PROFILE_SCOPE("CollisionSystem");

    auto players = registry.view<const Components::Player, const Components::Position, const Components::Radius>();
    auto destinations = registry.view<const Components::Destination, const Components::Position, const Components::Radius>();
    auto planets = registry.view<const Components::Planet, const Components::Position, const Components::Radius>();

    Outcome outcome = Outcome::None;
    for (auto [player, playerPos, playerRadius] : players.each()) {
        for (auto [dest, destPos, destRadius] : destinations.each()) {
            if (hasCollided(playerPos, playerRadius.value, destPos, destRadius.value)) {
                outcome = Outcome::Finished;
            }
        }
        for (auto [planet, planetPos, planetRadius] : planets.each()) {
            if (hasCollided(playerPos, playerRadius.value, planetPos, planetRadius.value)) {
                outcome = Outcome::Failed;
            }
        }
    }
    return outcome;
}

const char* outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Finished: return "Finished";
        case Outcome::Failed:   return "Failed";
        case Outcome::None:     break;
    }
    return "None";
}

} // namespace Systems
