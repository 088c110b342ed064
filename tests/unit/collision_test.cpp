#include <gtest/gtest.h>

#include <entt/entt.hpp>

#include "relativity/components/basic.hpp"
#include "relativity/systems/collision.hpp"

using namespace Systems;

TEST(CollisionTest, TouchingDiscsCollide) {
    EXPECT_TRUE(hasCollided(Position(0.0, 0.0), 1.0, Position(2.0, 0.0), 1.0));
}

TEST(CollisionTest, SeparatedDiscsDoNotCollide) {
    EXPECT_FALSE(hasCollided(Position(0.0, 0.0), 1.0, Position(2.0 + 1e-9, 0.0), 1.0));
    EXPECT_FALSE(hasCollided(Position(0.0, 0.0), 1e10, Position(3e10, 4e10), 3e10));
}

TEST(CollisionTest, OverlappingDiscsCollide) {
    EXPECT_TRUE(hasCollided(Position(0.0, 0.0), 1.0, Position(0.5, 0.5), 1.0));
    EXPECT_TRUE(hasCollided(Position(7.0, 7.0), 1.0, Position(7.0, 7.0), 1.0));
}

class CollisionSystemTest : public ::testing::Test {
protected:
    entt::registry registry;

    entt::entity createBody(double x, double y, double radius) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, x, y);
        registry.emplace<Components::Radius>(entity, radius);
        return entity;
    }

    void createPlayer(double x, double y) {
        registry.emplace<Components::Player>(createBody(x, y, 1.0));
    }
    void createDestination(double x, double y) {
        registry.emplace<Components::Destination>(createBody(x, y, 5.0));
    }
    void createPlanet(double x, double y) {
        registry.emplace<Components::Planet>(createBody(x, y, 5.0));
    }
};

TEST_F(CollisionSystemTest, NoPlayerMeansNoOutcome) {
    createDestination(0.0, 0.0);
    createPlanet(0.0, 0.0);
    EXPECT_EQ(CollisionSystem::check(registry), Outcome::None);
}

TEST_F(CollisionSystemTest, ReachingDestinationFinishes) {
    createPlayer(0.0, 0.0);
    createDestination(6.0, 0.0);
    createPlanet(100.0, 0.0);
    EXPECT_EQ(CollisionSystem::check(registry), Outcome::Finished);
}

TEST_F(CollisionSystemTest, HittingPlanetFails) {
    createPlayer(0.0, 0.0);
    createDestination(100.0, 0.0);
    createPlanet(0.0, 6.0);
    EXPECT_EQ(CollisionSystem::check(registry), Outcome::Failed);
}

TEST_F(CollisionSystemTest, PlanetOverridesDestinationInSameFrame) {
    createPlayer(0.0, 0.0);
    createDestination(3.0, 0.0);
    createPlanet(-3.0, 0.0);
    EXPECT_EQ(CollisionSystem::check(registry), Outcome::Failed);
}

TEST_F(CollisionSystemTest, ClearSpaceHasNoOutcome) {
    createPlayer(0.0, 0.0);
    createDestination(100.0, 0.0);
    createPlanet(0.0, 100.0);
    EXPECT_EQ(CollisionSystem::check(registry), Outcome::None);
}

TEST(OutcomeTest, Names) {
    EXPECT_STREQ(outcomeName(Outcome::None), "None");
    EXPECT_STREQ(outcomeName(Outcome::Finished), "Finished");
    EXPECT_STREQ(outcomeName(Outcome::Failed), "Failed");
}
