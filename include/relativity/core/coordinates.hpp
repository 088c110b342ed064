/**
 * @file coordinates.hpp
 * @brief Conversions between world, screen and fractional coordinates
 *
 * Handles conversion between:
 * - Meters (world space, used by all physics)
 * - Pixels (screen space, used by the trail, grid and renderer)
 * - Screen fractions (0-1 along each axis, used by level layouts)
 *
 * World and screen share an origin in the top-left corner with y growing
 * downward, so no axis flip is involved.
 */
#pragma once

#include "relativity/core/system_config.hpp"
#include "relativity/math/vector_math.hpp"

namespace Simulation {

/**
 * @class Coordinates
 * @brief Converts positions and lengths between world, screen and fraction space
 */
class Coordinates {
public:
    /**
     * @param config Supplies the screen size in pixels
     * @param screenWidthMeters World width covered by the screen
     */
    explicit Coordinates(const SystemConfig& config, double screenWidthMeters);

    /** @brief Uses the default config and the game's world scale */
    Coordinates();

    double pixelsToMeters(double pixels) const;
    double metersToPixels(double meters) const;

    Position worldToScreen(const Position& world) const;
    Position screenToWorld(const Position& screen) const;

    /**
     * @brief World position of a point given as fractions of the screen
     */
    Position fractionToWorld(double fx, double fy) const;

    /**
     * @brief Screen position of a point given as fractions of the screen
     */
    Position fractionToScreen(double fx, double fy) const;

    double getMetersPerPixel() const { return metersPerPixel; }
    double getWorldWidth() const { return worldWidth; }
    double getWorldHeight() const { return worldHeight; }
    unsigned int getScreenWidth() const { return screenWidth; }
    unsigned int getScreenHeight() const { return screenHeight; }

private:
    unsigned int screenWidth;
    unsigned int screenHeight;
    double metersPerPixel;
    double worldWidth;
    double worldHeight;
};

} // namespace Simulation
