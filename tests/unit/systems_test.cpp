#include <gtest/gtest.h>

#include <cmath>

#include <entt/entt.hpp>

#include "relativity/components/basic.hpp"
#include "relativity/core/constants.hpp"
#include "relativity/core/debug.hpp"
#include "relativity/physics/lorentz.hpp"
#include "relativity/systems/gravity.hpp"
#include "relativity/systems/movement.hpp"
#include "relativity/systems/time_dilation.hpp"

using namespace Systems;
using namespace RelativityConstants;

class SystemsTest : public ::testing::Test {
protected:
    entt::registry registry;

    entt::entity createPlayer(double x, double y, double vx, double vy, bool launched = true) {
        auto entity = registry.create();
        registry.emplace<Components::Player>(entity);
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::Velocity>(entity, vx, vy);
        registry.emplace<Components::Radius>(entity, UnitRadius / 4.0);
        registry.emplace<Components::Clock>(entity);
        registry.emplace<Components::VelocityGamma>(entity);
        registry.emplace<Components::GravitationalGamma>(entity);
        if (launched) {
            registry.emplace<Components::Launched>(entity);
        }
        return entity;
    }

    entt::entity createMass(double x, double y, double mass) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::Mass>(entity, mass);
        registry.emplace<Components::Planet>(entity);
        return entity;
    }

    entt::entity createObserver() {
        auto entity = registry.create();
        registry.emplace<Components::Observer>(entity);
        registry.emplace<Components::Clock>(entity);
        return entity;
    }
};

TEST_F(SystemsTest, GravityAcceleratesTowardMass) {
    auto player = createPlayer(0.0, 0.0, 0.0, 0.0);
    createMass(2e12, 0.0, MassOfSun);

    GravitySystem::update(registry, 100.0);

    const auto& vel = registry.get<Components::Velocity>(player);
    EXPECT_GT(vel.x, 0.0);
    EXPECT_NEAR(vel.y, 0.0, 1e-9);
}

TEST_F(SystemsTest, GravityIgnoresUnlaunchedBodies) {
    auto player = createPlayer(0.0, 0.0, 0.0, 0.0, false);
    createMass(2e12, 0.0, MassOfSun);

    GravitySystem::update(registry, 100.0);
    MovementSystem::update(registry, 100.0);

    EXPECT_TRUE(registry.get<Components::Velocity>(player).isZero());
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(player).x, 0.0);
}

TEST_F(SystemsTest, LaunchedBodyMovesAlongOneAxis) {
    // A purely horizontal launch must still be integrated
    auto player = createPlayer(0.0, 0.0, 1000.0, 0.0);

    GravitySystem::update(registry, 10.0);
    MovementSystem::update(registry, 10.0);

    const auto& pos = registry.get<Components::Position>(player);
    EXPECT_DOUBLE_EQ(pos.x, 10000.0);
    EXPECT_DOUBLE_EQ(pos.y, 0.0);
}

TEST_F(SystemsTest, DynamicMassesDoNotAttractThemselves) {
    auto mover = createMass(0.0, 0.0, MassOfSun);
    registry.emplace<Components::Velocity>(mover, 0.0, 0.0);
    registry.emplace<Components::Launched>(mover);

    GravitySystem::update(registry, 100.0);

    EXPECT_TRUE(registry.get<Components::Velocity>(mover).isZero());
}

TEST_F(SystemsTest, VelocityPassUsesSnapshotOfPositions) {
    // Two movers attract each other symmetrically regardless of iteration order
    auto a = createMass(-1e12, 0.0, MassOfSun);
    auto b = createMass(1e12, 0.0, MassOfSun);
    for (auto e : {a, b}) {
        registry.emplace<Components::Velocity>(e, 0.0, 0.0);
        registry.emplace<Components::Launched>(e);
    }

    GravitySystem::update(registry, 1000.0);

    double const va = registry.get<Components::Velocity>(a).x;
    double const vb = registry.get<Components::Velocity>(b).x;
    EXPECT_GT(va, 0.0);
    EXPECT_DOUBLE_EQ(va, -vb);
}

TEST_F(SystemsTest, ExcessSpeedIsClamped) {
    auto player = createPlayer(0.0, 0.0, 0.998 * C, 0.0);
    createMass(1e12, 0.0, MassOfSun);

    GravitySystem::update(registry, 1e4);

    double const speed = registry.get<Components::Velocity>(player).length();
    EXPECT_LE(speed, SpeedClampFraction * C * (1.0 + 1e-12));
    EXPECT_GT(registry.get<Components::Velocity>(player).x, 0.0);
}

TEST_F(SystemsTest, MovementUsesFinalVelocity) {
    auto player = createPlayer(0.0, 0.0, 10.0, -20.0);

    MovementSystem::update(registry, 2.0);

    const auto& pos = registry.get<Components::Position>(player);
    EXPECT_DOUBLE_EQ(pos.x, 20.0);
    EXPECT_DOUBLE_EQ(pos.y, -40.0);
}

TEST_F(SystemsTest, PlayerClockRunsSlowAtSpeed) {
    auto player = createPlayer(0.0, 0.0, 0.6 * C, 0.0);
    auto observer = createObserver();

    TimeDilationSystem::update(registry, 100.0);
    ObserverClockSystem::update(registry, 100.0);

    EXPECT_NEAR(registry.get<Components::VelocityGamma>(player).value, 1.25, 1e-12);
    EXPECT_DOUBLE_EQ(registry.get<Components::GravitationalGamma>(player).value, 1.0);
    EXPECT_NEAR(registry.get<Components::Clock>(player).value, 80.0, 1e-9);
    EXPECT_DOUBLE_EQ(registry.get<Components::Clock>(observer).value, 100.0);
}

TEST_F(SystemsTest, PlayerClockRunsSlowNearMass) {
    auto player = createPlayer(0.0, 0.0, 0.0, 0.0);
    createMass(2e12, 0.0, MassOfSun);

    TimeDilationSystem::update(registry, 100.0);

    double const gammaG = registry.get<Components::GravitationalGamma>(player).value;
    EXPECT_GT(gammaG, 1.0);
    EXPECT_NEAR(registry.get<Components::Clock>(player).value, 100.0 / gammaG, 1e-9);
}

TEST_F(SystemsTest, ZeroStepRecomputesGammasOnly) {
    auto player = createPlayer(0.0, 0.0, 0.8 * C, 0.0);

    TimeDilationSystem::update(registry, 0.0);

    EXPECT_NEAR(registry.get<Components::VelocityGamma>(player).value, 5.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(registry.get<Components::Clock>(player).value, 0.0);
}

TEST_F(SystemsTest, MissingEntitiesAreSkipped) {
    EXPECT_NO_THROW(TimeDilationSystem::update(registry, 10.0));
    EXPECT_NO_THROW(ObserverClockSystem::update(registry, 10.0));
    EXPECT_NO_THROW(GravitySystem::update(registry, 10.0));
    EXPECT_NO_THROW(MovementSystem::update(registry, 10.0));
}

TEST_F(SystemsTest, CollectMassesExcludesEntity) {
    auto a = createMass(0.0, 0.0, 1.0);
    createMass(1.0, 0.0, 2.0);

    EXPECT_EQ(GravitySystem::collectMasses(registry).size(), 2u);

    auto others = GravitySystem::collectMasses(registry, a);
    ASSERT_EQ(others.size(), 1u);
    EXPECT_DOUBLE_EQ(others[0].mass, 2.0);
}

TEST_F(SystemsTest, ClockNearMassLagsClockFarAway) {
    auto near = createPlayer(1e12, 0.0, 0.0, 0.0, false);
    auto far = createPlayer(1e14, 0.0, 0.0, 0.0, false);
    auto observer = createObserver();
    createMass(0.0, 0.0, MassOfSun);

    for (int tick = 0; tick < 10; ++tick) {
        TimeDilationSystem::update(registry, 144.0);
        ObserverClockSystem::update(registry, 144.0);
    }

    double const nearClock = registry.get<Components::Clock>(near).value;
    double const farClock = registry.get<Components::Clock>(far).value;
    double const observerClock = registry.get<Components::Clock>(observer).value;

    EXPECT_GT(registry.get<Components::GravitationalGamma>(near).value,
              registry.get<Components::GravitationalGamma>(far).value);
    EXPECT_LT(nearClock, farClock);
    EXPECT_LT(farClock, observerClock);
    EXPECT_NEAR(observerClock, 1440.0, 1e-9);
}

TEST_F(SystemsTest, FastClockLagsSlowClockAtSamePlace) {
    auto slow = createPlayer(0.0, 0.0, 0.1 * C, 0.0, false);
    auto fast = createPlayer(0.0, 0.0, 0.9 * C, 0.0, false);
    createMass(0.0, 2e12, MassOfSun);

    for (int tick = 0; tick < 10; ++tick) {
        TimeDilationSystem::update(registry, 144.0);
    }

    EXPECT_DOUBLE_EQ(registry.get<Components::GravitationalGamma>(slow).value,
                     registry.get<Components::GravitationalGamma>(fast).value);
    EXPECT_LT(registry.get<Components::Clock>(fast).value, registry.get<Components::Clock>(slow).value);
}

TEST_F(SystemsTest, KinematicsStatsTrackOnlyThePlayer) {
    KinematicsStats::reset();

    auto drifter = createMass(0.0, 0.0, MassOfEarth);
    registry.emplace<Components::Velocity>(drifter, 0.998 * C, 0.0);
    registry.emplace<Components::Launched>(drifter);
    createMass(1e12, 0.0, MassOfSun);

    GravitySystem::update(registry, 1e4);
    EXPECT_LE(registry.get<Components::Velocity>(drifter).length(), SpeedClampFraction * C * (1.0 + 1e-12));
    EXPECT_EQ(KinematicsStats::clampedCount(), 0);
    EXPECT_DOUBLE_EQ(KinematicsStats::maxSpeedFraction(), 0.0);

    createPlayer(0.0, 1e11, 0.998 * C, 0.0);
    GravitySystem::update(registry, 1e4);
    EXPECT_EQ(KinematicsStats::clampedCount(), 1);
    EXPECT_NEAR(KinematicsStats::maxSpeedFraction(), SpeedClampFraction, 1e-9);

    KinematicsStats::reset();
}
