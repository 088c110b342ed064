#include "relativity/visuals/color_map.hpp"

#include <algorithm>
#include <cmath>

namespace Visuals {

namespace {

    Rgba lerp(const Rgba& from, const Rgba& to, double t) {
        return Rgba{from.r + (to.r - from.r) * t,
                    from.g + (to.g - from.g) * t,
                    from.b + (to.b - from.b) * t,
                    from.a + (to.a - from.a) * t};
    }

    uint8_t toByte(double channel) {
        return static_cast<uint8_t>(std::lround(std::clamp(channel, 0.0, 1.0) * 255.0));
    }

    // Trail endpoints
    const Rgba TrailCool{0.2, 0.6, 1.0, 0.7};
    const Rgba TrailWarm{1.0, 0.3, 0.0, 0.9};

    // HUD stops
    const Rgba HudCyan{0.3, 0.85, 1.0, 1.0};
    const Rgba HudAmber{1.0, 0.85, 0.45, 1.0};
    const Rgba HudOrangeRed{1.0, 0.35, 0.1, 1.0};

    // Grid stops, alpha set separately
    const Rgba GridBlue{0.2, 0.4, 1.0, 1.0};
    const Rgba GridPurple{0.6, 0.2, 0.8, 1.0};
    const Rgba GridOrange{1.0, 0.4, 0.1, 1.0};

} // namespace

double gammaBlend(double gamma) {
    return std::clamp((gamma - 1.0) / 2.0, 0.0, 1.0);
}

Rgba gammaToColor(double gamma) {
    return lerp(TrailCool, TrailWarm, gammaBlend(gamma));
}

Rgba hudGammaColor(double gamma) {
    double const t = gammaBlend(gamma);
    if (t < 0.5) {
        return lerp(HudCyan, HudAmber, t * 2.0);
    }
    return lerp(HudAmber, HudOrangeRed, (t - 0.5) * 2.0);
}

Rgba curvatureColor(double dispA, double dispB, double maxDisplacement) {
    double t = 0.0;
    if (maxDisplacement > 0.0) {
        t = std::clamp((dispA + dispB) * 0.5 / maxDisplacement, 0.0, 1.0);
    }

    Rgba c = t < 0.5 ? lerp(GridBlue, GridPurple, t * 2.0)
                     : lerp(GridPurple, GridOrange, (t - 0.5) * 2.0);
    c.a = 0.08 + t * 0.45;
    return c;
}

Components::Color toColor(const Rgba& c) {
    return Components::Color(toByte(c.r), toByte(c.g), toByte(c.b), toByte(c.a));
}

} // namespace Visuals
