#ifndef RELATIVITY_COMPONENTS_BASIC_HPP
#define RELATIVITY_COMPONENTS_BASIC_HPP

#include <cstdint>
#include <cstddef>
#include <deque>
#include <utility>

#include "relativity/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // World-space position in meters and velocity in m/s
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Mass {
        double value; // kg
    };

    struct Radius {
        double value; // meters, used for collision and sprite size
    };

    // 8-bit RGBA
    struct Color {
        uint8_t r, g, b, a;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255, uint8_t a = 255)
            : r(r), g(g), b(b), a(a) {}

        bool operator==(const Color& o) const {
            return r == o.r && g == o.g && b == o.b && a == o.a;
        }
        bool operator!=(const Color& o) const { return !(*this == o); }
    };

    // Entity kinds. A body may carry more than one (the destination has mass too).
    struct Player {};
    struct Planet {};
    struct Destination {};
    struct Observer {};

    /**
     * @brief Marks a body the integrator advances
     *
     * The player receives it on launch; dynamic planets carry it from spawn.
     */
    struct Launched {};

    /**
     * @brief Elapsed time in seconds, never decreases during an attempt
     */
    struct Clock {
        double value = 0.0;
    };

    struct VelocityGamma {
        double value = 1.0;
    };

    struct GravitationalGamma {
        double value = 1.0;
    };

    // Display name, used by the renderer and log output
    struct Label {
        const char* text;
    };

    /**
     * @brief Bounded history of (screen position, color) samples for the player trail
     */
    struct TrailBuffer {
        static constexpr std::size_t Capacity = 2000;
        std::deque<std::pair<Position, Color>> points;
    };

} // namespace Components

#endif
