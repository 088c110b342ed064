/**
 * @file gravity_field.cpp
 * @brief Field evaluation for point masses
 */

#include "relativity/physics/gravity_field.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "relativity/core/constants.hpp"

namespace Physics {

double relativisticFactor(double mass, double distance) {
    using namespace RelativityConstants;

    double const factor = 1.0 - (2.0 * G * mass) / (C * C * distance);
    return std::max(factor, RelativisticFactorFloor);
}

FieldSample computeFieldAtPoint(const Position& point, const std::vector<MassSample>& masses) {
    using namespace RelativityConstants;

    Vector total;
    for (const auto& m : masses) {
        Vector const d = displacement(point, m.position);
        double const dist = d.length();
        if (dist < ZeroDistance) {
            continue;
        }

        double const newtonian = G * m.mass / (dist * dist);
        total += (d / dist) * (newtonian * relativisticFactor(m.mass, dist));
    }

    FieldSample sample;
    sample.magnitude = total.length();
    if (sample.magnitude < ZeroDistance) {
        sample.magnitude = 0.0;
        return sample;
    }
    if (!std::isfinite(sample.magnitude)) {
        // Overflowed sum, no usable direction
        sample.magnitude = std::numeric_limits<double>::infinity();
        return sample;
    }

    sample.acceleration = total;
    sample.direction = total / sample.magnitude;
    return sample;
}

} // namespace Physics
