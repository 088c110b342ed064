/**
 * @file coordinates.cpp
 * @brief Implementation of coordinate conversion utilities
 */

#include "relativity/core/coordinates.hpp"

#include "relativity/core/constants.hpp"

namespace Simulation {

Coordinates::Coordinates(const SystemConfig& config, double screenWidthMeters)
    : screenWidth(config.ScreenWidthPixels),
      screenHeight(config.ScreenHeightPixels),
      metersPerPixel(screenWidthMeters / static_cast<double>(config.ScreenWidthPixels)),
      worldWidth(screenWidthMeters),
      worldHeight(metersPerPixel * static_cast<double>(config.ScreenHeightPixels))
{
}

Coordinates::Coordinates()
    : Coordinates(defaultSystemConfig(), RelativityConstants::ScreenWidthMeters)
{
}

double Coordinates::pixelsToMeters(double pixels) const {
    return pixels * metersPerPixel;
}

double Coordinates::metersToPixels(double meters) const {
    return meters / metersPerPixel;
}

Position Coordinates::worldToScreen(const Position& world) const {
    return Position(metersToPixels(world.x), metersToPixels(world.y));
}

Position Coordinates::screenToWorld(const Position& screen) const {
    return Position(pixelsToMeters(screen.x), pixelsToMeters(screen.y));
}

Position Coordinates::fractionToWorld(double fx, double fy) const {
    return Position(fx * worldWidth, fy * worldHeight);
}

Position Coordinates::fractionToScreen(double fx, double fy) const {
    return Position(fx * screenWidth, fy * screenHeight);
}

} // namespace Simulation
