#include <gtest/gtest.h>

#include "relativity/core/constants.hpp"
#include "relativity/core/sim_time.hpp"

using Simulation::SimRate;

TEST(SimRateTest, DefaultsToOne) {
    SimRate rate;
    EXPECT_DOUBLE_EQ(rate.value(), 1.0);
}

TEST(SimRateTest, StepsAndSaturates) {
    SimRate rate;
    rate.increase();
    EXPECT_DOUBLE_EQ(rate.value(), 1.25);

    for (int i = 0; i < 20; ++i) {
        rate.increase();
    }
    EXPECT_DOUBLE_EQ(rate.value(), SimRate::Max);

    for (int i = 0; i < 20; ++i) {
        rate.decrease();
    }
    EXPECT_DOUBLE_EQ(rate.value(), SimRate::Min);

    rate.reset();
    EXPECT_DOUBLE_EQ(rate.value(), SimRate::Default);
}

TEST(SimRateTest, SetSnapsToStepAndClamps) {
    SimRate rate;
    rate.set(1.3);
    EXPECT_DOUBLE_EQ(rate.value(), 1.25);
    rate.set(10.0);
    EXPECT_DOUBLE_EQ(rate.value(), 2.0);
    rate.set(-3.0);
    EXPECT_DOUBLE_EQ(rate.value(), 0.25);

    SimRate explicitRate(0.5);
    EXPECT_DOUBLE_EQ(explicitRate.value(), 0.5);
}

TEST(SimTimeTest, OneRealSecondIsATenthOfADay) {
    double const dt = Simulation::elapsedSimulationTime(1.0, 1.0, RelativityConstants::SecondsPerRealSecond);
    EXPECT_DOUBLE_EQ(dt, 8640.0);
}

TEST(SimTimeTest, ScalesWithRate) {
    double const base = Simulation::elapsedSimulationTime(0.5, 1.0, 8640.0);
    double const fast = Simulation::elapsedSimulationTime(0.5, 2.0, 8640.0);
    EXPECT_DOUBLE_EQ(fast, 2.0 * base);
}

TEST(SimTimeTest, NegativeFrameIsZero) {
    EXPECT_DOUBLE_EQ(Simulation::elapsedSimulationTime(-0.1, 1.0, 8640.0), 0.0);
    EXPECT_DOUBLE_EQ(Simulation::elapsedSimulationTime(0.0, 1.0, 8640.0), 0.0);
}
