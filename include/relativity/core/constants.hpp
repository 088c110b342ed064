/**
 * @file constants.hpp
 * @brief Physical constants and unit conversions for the relativity core
 *
 * All physics runs in SI units (meters, kilograms, seconds, m/s). The game
 * world is scaled so that interplanetary distances fit on one screen and
 * masses are inflated until relativistic effects become visible:
 * - one screen width is 6e9 km
 * - masses carry a MassFactor of 1e8
 * - one real second of play is DaysPerSecond simulated days
 */

#ifndef RELATIVITY_CONSTANTS_HPP
#define RELATIVITY_CONSTANTS_HPP

namespace RelativityConstants {

    // Truly global constants
    extern const double G;           // Gravitational constant, m^3 kg^-1 s^-2
    extern const double C;           // Speed of light, m/s
    extern const double SecondsPerDay;

    // World scaling
    extern const double MassFactor;
    extern const double MassOfSun;   // kg, already scaled by MassFactor
    extern const double MassOfEarth; // kg, already scaled by MassFactor
    extern const double UnitRadius;  // meters
    extern const double ScreenWidthMeters;
    extern const double ScreenHeightMeters;

    // Display
    extern const unsigned int ScreenWidthPixels;
    extern const unsigned int ScreenHeightPixels;

    // Time
    extern const double DaysPerSecond;
    extern const double SecondsPerRealSecond; // simulated seconds per real second at 1x

    // Launch and clamps
    extern const double MaxLaunchSpeedFraction;
    extern const double MaxLaunchSpeed;          // m/s
    extern const double SpeedClampFraction;
    extern const double RelativisticFactorFloor; // floor on 1 - 2GM/(c^2 d)
    extern const double ZeroDistance;            // meters, below this a field sample is degenerate

    // Unit conversions
    double kilometersToMeters(double km);
    double metersToKilometers(double meters);
    double kmPerSecondToMetersPerSecond(double kms);
    double metersPerSecondToKmPerSecond(double ms);
    double secondsToDays(double seconds);
    double daysToSeconds(double days);

    /**
     * @brief Fraction of light speed for a speed in m/s
     */
    double speedFractionOfC(double speed);

} // namespace RelativityConstants

#endif // RELATIVITY_CONSTANTS_HPP
