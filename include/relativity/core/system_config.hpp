#pragma once

/**
 * @struct SystemConfig
 * @brief Tuning parameters for the simulation and its visual consumers.
 *
 * Physical constants live in RelativityConstants; everything here is a
 * gameplay or presentation choice and may differ between front-ends.
 */
struct SystemConfig {
    // Simulated seconds per real second at 1x rate (0.1 days)
    double SecondsPerRealSecond = 8640.0;

    // Real-time delay before a failed attempt returns to aiming
    double FailureResetSeconds = 1.5;

    // Screen
    unsigned int ScreenWidthPixels  = 1280;
    unsigned int ScreenHeightPixels = 720;

    // Gravity grid
    unsigned int GridColumns = 40;
    unsigned int GridRows = 24;
    double GridMaxDisplacementPixels = 80.0;
    double GridDisplacementScale = 18.0;
    double GridReferenceFieldStrength = 50.0; // m/s^2
    double GridNearestMassFraction = 0.5;
    double GridMinSpacingPixels = 2.0;

    // Launch drag: full power at this fraction of the screen width
    double LaunchMaxDragFraction = 0.8;
};

/**
 * @brief Default configuration matching the shipped game
 */
SystemConfig defaultSystemConfig();
