#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>

// Log levels
#define RELATIVITY_LOG_NONE 0
#define RELATIVITY_LOG_WARN 1
#define RELATIVITY_LOG_INFO 2
#define RELATIVITY_LOG_DEBUG 3

// Set current log level (override with -DRELATIVITY_LOG_LEVEL=...)
#ifndef RELATIVITY_LOG_LEVEL
#define RELATIVITY_LOG_LEVEL RELATIVITY_LOG_INFO
#endif

#define RELATIVITY_LOG(level, stream, tag, x) do { \
    if ((level) <= RELATIVITY_LOG_LEVEL) { \
        stream << tag << x << '\n'; \
    } \
} while(0)

#define WARN_MSG(x)  RELATIVITY_LOG(RELATIVITY_LOG_WARN, std::cerr, "[warn] ", x)
#define INFO_MSG(x)  RELATIVITY_LOG(RELATIVITY_LOG_INFO, std::cerr, "[info] ", x)
#define DEBUG_MSG(x) RELATIVITY_LOG(RELATIVITY_LOG_DEBUG, std::cout, "[debug] ", x)

// Collects the player's kinematic extremes per attempt for debug output
class KinematicsStats {
public:
    static void reset() {
        max_speed_fraction = 0.0;
        clamped_count = 0;
        samples = 0;
    }

    static void recordSpeed(double fraction) {
        max_speed_fraction = std::max(max_speed_fraction, fraction);
        samples++;
    }

    static void recordClamp() {
        clamped_count++;
    }

    static double maxSpeedFraction() { return max_speed_fraction; }
    static int clampedCount() { return clamped_count; }

    static void print() {
        DEBUG_MSG("Kinematics stats:\n"
            "  Samples: " << samples << "\n"
            "  Peak speed: " << max_speed_fraction << " c\n"
            "  Speed clamps: " << clamped_count);
    }

private:
    static double max_speed_fraction;
    static int clamped_count;
    static int samples;
};
