#include "relativity/physics/launch.hpp"

#include <algorithm>

#include "relativity/core/constants.hpp"

namespace Physics {

double mapPowerNonlinear(double power) {
    double const p = std::clamp(power, 0.0, 1.0);
    return p * p;
}

Vector launchVelocity(const Vector& direction, double rawPower) {
    using namespace RelativityConstants;

    if (direction.isZero()) {
        return Vector();
    }

    double const capped = std::min(mapPowerNonlinear(rawPower), MaxLaunchSpeedFraction);
    double const speed = capped / MaxLaunchSpeedFraction * MaxLaunchSpeed;
    return direction.normalized() * speed;
}

double powerFromDrag(double dragPixels, double maxDragPixels) {
    if (maxDragPixels <= 0.0) {
        return 0.0;
    }
    return std::clamp(dragPixels / maxDragPixels, 0.0, 1.0);
}

void LaunchGesture::press(const Vector& direction) {
    if (currentPhase != Phase::Idle) {
        return;
    }
    aimDirection = direction.normalized();
    currentPower = 0.0;
    currentPhase = Phase::AimLocked;
}

void LaunchGesture::drag(double power) {
    if (currentPhase == Phase::Idle) {
        return;
    }
    currentPower = std::clamp(power, 0.0, 1.0);
    currentPhase = Phase::Launching;
}

std::optional<Vector> LaunchGesture::release() {
    if (currentPhase != Phase::Launching) {
        cancel();
        return std::nullopt;
    }

    Vector const velocity = launchVelocity(aimDirection, currentPower);
    cancel();
    return velocity;
}

void LaunchGesture::cancel() {
    currentPhase = Phase::Idle;
    currentPower = 0.0;
    aimDirection = Vector();
}

} // namespace Physics
