/**
 * @file color_map.hpp
 * @brief Pure color mappings for gamma and grid curvature
 *
 * All mappings clamp their input, so any gamma >= 1 (or below) and any
 * displacement yield channels in [0, 1]. Red never decreases and blue
 * never increases as gamma grows.
 */

#ifndef RELATIVITY_COLOR_MAP_HPP
#define RELATIVITY_COLOR_MAP_HPP

#include "relativity/components/basic.hpp"

namespace Visuals {

/**
 * @brief Linear RGBA with channels in [0, 1]
 */
struct Rgba {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;
};

/**
 * @brief Blend parameter for a gamma, clamp((gamma - 1) / 2, 0, 1)
 */
double gammaBlend(double gamma);

/**
 * @brief Trail color, cool blue at gamma 1 to warm orange at gamma >= 3
 */
Rgba gammaToColor(double gamma);

/**
 * @brief HUD readout color: cyan, then amber at gamma 2, then orange-red
 */
Rgba hudGammaColor(double gamma);

/**
 * @brief Grid segment color from the mean displacement of its endpoints
 * @param maxDisplacement Largest displacement in the grid, must be > 0
 */
Rgba curvatureColor(double dispA, double dispB, double maxDisplacement);

/**
 * @brief Quantizes to 8-bit channels
 */
Components::Color toColor(const Rgba& c);

} // namespace Visuals

#endif // RELATIVITY_COLOR_MAP_HPP
