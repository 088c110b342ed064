#include "relativity/core/debug.hpp"

// Initialize static members
double KinematicsStats::max_speed_fraction = 0.0;
int KinematicsStats::clamped_count = 0;
int KinematicsStats::samples = 0;
