/**
 * @file lorentz.hpp
 * @brief Velocity and gravitational time-dilation factors
 *
 * - velocityGamma: special-relativistic factor for a speed below c
 * - gravitationalGamma: product of per-mass weak-field factors
 * - advanceProperTime: clock step for a body experiencing both
 */

#ifndef RELATIVITY_LORENTZ_HPP
#define RELATIVITY_LORENTZ_HPP

#include <vector>

#include "relativity/physics/gravity_field.hpp"

namespace Physics {

/**
 * @brief 1 / sqrt(1 - (v/c)^2)
 * @param speed Magnitude of velocity in m/s, must be below c
 *
 * Asserts in debug builds when speed >= c and returns +infinity in release
 * builds.
 */
double velocityGamma(double speed);

/**
 * @brief Product over masses of 1 / sqrt(relativisticFactor(M, d))
 *
 * Exactly 1.0 for an empty mass list. Masses closer than ZeroDistance are
 * skipped.
 */
double gravitationalGamma(const Position& point, const std::vector<MassSample>& masses);

/**
 * @brief Clock value after dt of coordinate time at the given dilation
 *
 * Negative dt is treated as zero so clocks never run backward.
 */
double advanceProperTime(double clock, double dt, double velocityGamma, double gravitationalGamma);

} // namespace Physics

#endif // RELATIVITY_LORENTZ_HPP
