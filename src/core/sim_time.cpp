#include "relativity/core/sim_time.hpp"

#include <algorithm>
#include <cmath>

namespace Simulation {

SimRate::SimRate(double value) {
    set(value);
}

void SimRate::increase() {
    set(rate + Step);
}

void SimRate::decrease() {
    set(rate - Step);
}

void SimRate::set(double value) {
    // Snap to the step grid so repeated +/- never drifts off 0.25 multiples
    double const snapped = std::round(value / Step) * Step;
    rate = std::clamp(snapped, Min, Max);
}

double elapsedSimulationTime(double realSeconds, double rate, double secondsPerRealSecond) {
    if (realSeconds <= 0.0) {
        return 0.0;
    }
    return secondsPerRealSecond * realSeconds * rate;
}

} // namespace Simulation
