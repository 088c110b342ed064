#include "relativity/core/constants.hpp"

namespace RelativityConstants {

    const double G             = 6.674e-11;
    const double C             = 299792.0 * 1000.0;
    const double SecondsPerDay = 24.0 * 3600.0;

    const double MassFactor  = 100000000.0;
    const double MassOfSun   = MassFactor * 1.989e30;
    const double MassOfEarth = MassFactor * 5.972e24;
    const double UnitRadius  = 60000000.0 * 1000.0;

    // Display
    const unsigned int ScreenWidthPixels  = 1280;
    const unsigned int ScreenHeightPixels = 720;

    const double ScreenWidthMeters  = 6000000000.0 * 1000.0;
    const double ScreenHeightMeters = ScreenWidthMeters * ScreenHeightPixels / ScreenWidthPixels;

    const double DaysPerSecond        = 0.1;
    const double SecondsPerRealSecond = DaysPerSecond * SecondsPerDay;

    const double MaxLaunchSpeedFraction  = 0.99;
    const double MaxLaunchSpeed          = MaxLaunchSpeedFraction * C;
    const double SpeedClampFraction      = 0.999;
    const double RelativisticFactorFloor = 1e-4;
    const double ZeroDistance            = 1e-30;

    double kilometersToMeters(double km) {
        return km * 1000.0;
    }

    double metersToKilometers(double meters) {
        return meters / 1000.0;
    }

    double kmPerSecondToMetersPerSecond(double kms) {
        return kms * 1000.0;
    }

    double metersPerSecondToKmPerSecond(double ms) {
        return ms / 1000.0;
    }

    double secondsToDays(double seconds) {
        return seconds / SecondsPerDay;
    }

    double daysToSeconds(double days) {
        return days * SecondsPerDay;
    }

    double speedFractionOfC(double speed) {
        return speed / C;
    }

} // namespace RelativityConstants
