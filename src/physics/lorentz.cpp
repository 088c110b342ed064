/**
 * @file lorentz.cpp
 * @brief Lorentz and gravitational gamma evaluation
 */

#include "relativity/physics/lorentz.hpp"

#include <cassert>
#include <cmath>
#include <limits>

#include "relativity/core/constants.hpp"

namespace Physics {

double velocityGamma(double speed) {
    using RelativityConstants::C;

    double const beta = speed / C;
    assert(beta < 1.0 && "velocityGamma: speed must be below c");
    if (beta >= 1.0) {
        return std::numeric_limits<double>::infinity();
    }
    return 1.0 / std::sqrt(1.0 - beta * beta);
}

double gravitationalGamma(const Position& point, const std::vector<MassSample>& masses) {
    double gamma = 1.0;
    for (const auto& m : masses) {
        double const dist = point.dist(m.position);
        if (dist < RelativityConstants::ZeroDistance) {
            continue;
        }
        gamma *= 1.0 / std::sqrt(relativisticFactor(m.mass, dist));
    }
    return gamma;
}

double advanceProperTime(double clock, double dt, double velocityGamma, double gravitationalGamma) {
    if (dt <= 0.0) {
        return clock;
    }
    return clock + dt / (velocityGamma * gravitationalGamma);
}

} // namespace Physics
