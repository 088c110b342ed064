/**
 * @file launch.hpp
 * @brief Mapping from drag gestures to launch velocities
 *
 * A launch is a three-phase gesture:
 * - press locks the aim angle (Idle -> AimLocked)
 * - dragging sets the power from the drag distance (-> Launching)
 * - release fires, or cancels when no drag happened
 */

#ifndef RELATIVITY_LAUNCH_HPP
#define RELATIVITY_LAUNCH_HPP

#include <optional>

#include "relativity/math/vector_math.hpp"

namespace Physics {

/**
 * @brief Power curve, clamp(p, 0, 1)^2
 *
 * Monotone non-decreasing with mapPowerNonlinear(0) = 0 and
 * mapPowerNonlinear(1) = 1.
 */
double mapPowerNonlinear(double power);

/**
 * @brief Velocity for a launch along direction at the given raw power
 *
 * The mapped power is capped at 0.99 so full power yields exactly
 * MaxLaunchSpeed. A zero direction yields the zero vector.
 */
Vector launchVelocity(const Vector& direction, double rawPower);

/**
 * @brief Raw power for a drag of dragPixels, full at maxDragPixels
 */
double powerFromDrag(double dragPixels, double maxDragPixels);

/**
 * @class LaunchGesture
 * @brief Aim/power/fire state machine driven by pointer events
 */
class LaunchGesture {
public:
    enum class Phase {
        Idle,
        AimLocked,
        Launching
    };

    /**
     * @brief Locks the aim toward direction; ignored unless Idle
     */
    void press(const Vector& direction);

    /**
     * @brief Updates power while aiming; ignored when Idle
     */
    void drag(double power);

    /**
     * @brief Ends the gesture
     * @return The launch velocity, or nothing when released without a drag
     */
    std::optional<Vector> release();

    /** @brief Abandons any gesture in progress */
    void cancel();

    Phase phase() const { return currentPhase; }
    const Vector& aim() const { return aimDirection; }
    double power() const { return currentPower; }

private:
    Phase currentPhase = Phase::Idle;
    Vector aimDirection;
    double currentPower = 0.0;
};

} // namespace Physics

#endif // RELATIVITY_LAUNCH_HPP
