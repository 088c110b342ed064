/**
 * @file collision.hpp
 * @brief Player contact tests against the destination and obstacles
 */

#ifndef RELATIVITY_COLLISION_SYSTEM_HPP
#define RELATIVITY_COLLISION_SYSTEM_HPP

#include <entt/entt.hpp>

#include "relativity/math/vector_math.hpp"

namespace Systems {

/**
 * @brief Result of one collision pass
 */
enum class Outcome {
    None,
    Finished,
    Failed
};

/**
 * @brief True when two discs touch or overlap (distance <= r1 + r2)
 */
bool hasCollided(const Position& p1, double r1, const Position& p2, double r2);

/**
 * @class CollisionSystem
 * @brief Detects whether the player reached the destination or hit a planet
 *
 * The destination is tested first, then every Planet. A later hit
 * overwrites an earlier one, so a frame touching both reports Failed.
 */
class CollisionSystem {
public:
    /**
     * @return Outcome::None when nothing was hit or no player exists
     */
    static Outcome check(const entt::registry& registry);
};

const char* outcomeName(Outcome outcome);

} // namespace Systems

#endif // RELATIVITY_COLLISION_SYSTEM_HPP
