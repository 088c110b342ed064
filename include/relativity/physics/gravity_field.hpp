/**
 * @file gravity_field.hpp
 * @brief Gravitational field of a set of point masses with a strong-field correction
 *
 * Each mass contributes a Newtonian acceleration G*M/d^2 toward itself,
 * scaled by the relativistic factor f = max(1 - 2GM/(c^2 d), floor). The
 * same sample feeds the integrator and the gravity grid.
 */

#ifndef RELATIVITY_GRAVITY_FIELD_HPP
#define RELATIVITY_GRAVITY_FIELD_HPP

#include <vector>

#include "relativity/math/vector_math.hpp"

namespace Physics {

/**
 * @brief A point mass as seen by the field model
 */
struct MassSample {
    Position position; // meters
    double mass;       // kg
};

/**
 * @brief Net field at a point
 *
 * direction is the unit vector of acceleration, or the zero vector when the
 * magnitude is below RelativityConstants::ZeroDistance. A sum that overflows
 * reports an infinite magnitude with zero acceleration and direction.
 */
struct FieldSample {
    Vector acceleration; // m/s^2
    double magnitude = 0.0;
    Vector direction;
};

/**
 * @brief 1 - 2GM/(c^2 d) clamped below at RelativisticFactorFloor
 *
 * Shared by the field correction and the gravitational gamma.
 */
double relativisticFactor(double mass, double distance);

/**
 * @brief Field at a point from the given masses
 *
 * Masses closer than ZeroDistance to the point are skipped. Never returns
 * NaN; no masses yields a zero sample.
 */
FieldSample computeFieldAtPoint(const Position& point, const std::vector<MassSample>& masses);

} // namespace Physics

#endif // RELATIVITY_GRAVITY_FIELD_HPP
