/**
 * @file hud_format.hpp
 * @brief Text for the HUD readouts
 */

#ifndef RELATIVITY_HUD_FORMAT_HPP
#define RELATIVITY_HUD_FORMAT_HPP

#include <string>

namespace Visuals {

/** @brief "t_p = 1.23" with the clock shown in days */
std::string formatPlayerTime(double seconds);

/** @brief "t_o = 1.23" with the clock shown in days */
std::string formatObserverTime(double seconds);

/** @brief "<label> = 1.23" */
std::string formatGamma(const std::string& label, double gamma);

/** @brief "v = 0.71c" for a speed in m/s */
std::string formatVelocityFraction(double speed);

/** @brief "1.25x" */
std::string formatSimRate(double rate);

} // namespace Visuals

#endif // RELATIVITY_HUD_FORMAT_HPP
