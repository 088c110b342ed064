/**
 * @file sim_time.hpp
 * @brief Simulation rate multiplier and elapsed simulation time
 *
 * Simulated time per frame is decoupled from wall-clock time:
 *   dt_sim = SecondsPerRealSecond * realSeconds * rate
 * The same dt_sim feeds the integrator and both clocks so physics and
 * time dilation stay in step under rate changes.
 */

#pragma once

namespace Simulation {

/**
 * @class SimRate
 * @brief User-adjustable multiplier in [Min, Max] moving in Step increments
 */
class SimRate {
public:
    static constexpr double Min     = 0.25;
    static constexpr double Max     = 2.0;
    static constexpr double Step    = 0.25;
    static constexpr double Default = 1.0;

    SimRate() = default;

    /**
     * @brief Construct with an explicit value, clamped into range
     */
    explicit SimRate(double value);

    double value() const { return rate; }

    /** @brief Raise by one step, saturating at Max */
    void increase();

    /** @brief Lower by one step, saturating at Min */
    void decrease();

    void reset() { rate = Default; }

    /**
     * @brief Set to the nearest step inside [Min, Max]
     */
    void set(double value);

private:
    double rate = Default;
};

/**
 * @brief Simulated seconds elapsed for a frame of realSeconds at the given rate
 *
 * Negative frame times are treated as zero.
 */
double elapsedSimulationTime(double realSeconds, double rate, double secondsPerRealSecond);

} // namespace Simulation
