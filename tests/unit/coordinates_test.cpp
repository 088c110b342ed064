#include <gtest/gtest.h>

#include "relativity/core/constants.hpp"
#include "relativity/core/coordinates.hpp"

using Simulation::Coordinates;

TEST(CoordinatesTest, WorldSpansScreen) {
    Coordinates coords;
    EXPECT_DOUBLE_EQ(coords.getWorldWidth(), RelativityConstants::ScreenWidthMeters);
    EXPECT_NEAR(coords.getWorldHeight(), RelativityConstants::ScreenHeightMeters, 1.0);
    EXPECT_DOUBLE_EQ(coords.getMetersPerPixel(), 6e12 / 1280.0);
}

TEST(CoordinatesTest, FractionToScreen) {
    Coordinates coords;
    Position const p = coords.worldToScreen(coords.fractionToWorld(0.3, 0.3));
    EXPECT_NEAR(p.x, 384.0, 1e-9);
    EXPECT_NEAR(p.y, 216.0, 1e-9);

    Position const corner = coords.fractionToScreen(1.0, 1.0);
    EXPECT_DOUBLE_EQ(corner.x, 1280.0);
    EXPECT_DOUBLE_EQ(corner.y, 720.0);
}

TEST(CoordinatesTest, ScreenWorldRoundTrip) {
    Coordinates coords;
    Position const screen(123.5, 456.25);
    Position const back = coords.worldToScreen(coords.screenToWorld(screen));
    EXPECT_NEAR(back.x, screen.x, 1e-9);
    EXPECT_NEAR(back.y, screen.y, 1e-9);
}

TEST(CoordinatesTest, LengthsShareOneScale) {
    Coordinates coords;
    double const meters = RelativityConstants::UnitRadius;
    EXPECT_NEAR(coords.pixelsToMeters(coords.metersToPixels(meters)), meters, 1e-3);
    EXPECT_NEAR(coords.metersToPixels(meters), 12.8, 1e-9);
}

TEST(CoordinatesTest, CustomScreen) {
    SystemConfig config;
    config.ScreenWidthPixels = 640;
    config.ScreenHeightPixels = 480;
    Coordinates coords(config, 1000.0);

    EXPECT_DOUBLE_EQ(coords.getMetersPerPixel(), 1000.0 / 640.0);
    EXPECT_DOUBLE_EQ(coords.getWorldHeight(), 750.0);
}
