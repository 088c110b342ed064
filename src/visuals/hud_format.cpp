#include "relativity/visuals/hud_format.hpp"

#include <iomanip>
#include <sstream>

#include "relativity/core/constants.hpp"

namespace Visuals {

namespace {

    std::string labelled(const std::string& label, double value, const char* suffix = "") {
        std::ostringstream out;
        out << label << " = " << std::fixed << std::setprecision(2) << value << suffix;
        return out.str();
    }

} // namespace

std::string formatPlayerTime(double seconds) {
    return labelled("t_p", RelativityConstants::secondsToDays(seconds));
}

std::string formatObserverTime(double seconds) {
    return labelled("t_o", RelativityConstants::secondsToDays(seconds));
}

std::string formatGamma(const std::string& label, double gamma) {
    return labelled(label, gamma);
}

std::string formatVelocityFraction(double speed) {
    return labelled("v", RelativityConstants::speedFractionOfC(speed), "c");
}

std::string formatSimRate(double rate) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << rate << "x";
    return out.str();
}

} // namespace Visuals
