#include <gtest/gtest.h>
#include "relativity/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);
}

TEST(VectorMathTest, VectorAddition) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);

    Vector result = v1 + v2;
    EXPECT_DOUBLE_EQ(result.x, 4.0);
    EXPECT_DOUBLE_EQ(result.y, 6.0);

    v1 += v2;
    EXPECT_DOUBLE_EQ(v1.x, 4.0);
    EXPECT_DOUBLE_EQ(v1.y, 6.0);

    v1 -= v2;
    EXPECT_DOUBLE_EQ(v1.x, 1.0);
    EXPECT_DOUBLE_EQ(v1.y, 2.0);
}

TEST(VectorMathTest, VectorScalarOperations) {
    Vector v(2.0, 3.0);
    double scalar = 2.0;

    Vector mult_result = v * scalar;
    EXPECT_DOUBLE_EQ(mult_result.x, 4.0);
    EXPECT_DOUBLE_EQ(mult_result.y, 6.0);

    Vector div_result = v / 0.5;
    EXPECT_DOUBLE_EQ(div_result.x, 4.0);
    EXPECT_DOUBLE_EQ(div_result.y, 6.0);

    v *= 3.0;
    EXPECT_DOUBLE_EQ(v.x, 6.0);
    EXPECT_DOUBLE_EQ(v.y, 9.0);

    Vector neg = -v;
    EXPECT_DOUBLE_EQ(neg.x, -6.0);
    EXPECT_DOUBLE_EQ(neg.y, -9.0);
}

TEST(VectorMathTest, VectorMethods) {
    Vector v(3.0, 4.0);

    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);

    // scale keeps direction
    Vector v2 = v.scale(10.0);
    EXPECT_DOUBLE_EQ(v2.length(), 10.0);
    EXPECT_DOUBLE_EQ(v2.x, 6.0);
    EXPECT_DOUBLE_EQ(v2.y, 8.0);

    Vector n = v.normalized();
    EXPECT_DOUBLE_EQ(n.length(), 1.0);
    EXPECT_DOUBLE_EQ(n.x, 0.6);
}

TEST(VectorMathTest, ZeroVectorNormalizesToZero) {
    Vector zero;
    EXPECT_TRUE(zero.isZero());

    Vector n = zero.normalized();
    EXPECT_TRUE(n.isZero());
    EXPECT_TRUE(zero.scale(5.0).isZero());
}

TEST(VectorMathTest, PositionOperations) {
    Position p1(1.0, 2.0);
    Position p2(3.0, 4.0);

    Position p3 = p1 + p2;
    EXPECT_DOUBLE_EQ(p3.x, 4.0);
    EXPECT_DOUBLE_EQ(p3.y, 6.0);

    Position p4 = p2 - p1;
    EXPECT_DOUBLE_EQ(p4.x, 2.0);
    EXPECT_DOUBLE_EQ(p4.y, 2.0);

    EXPECT_DOUBLE_EQ(p1.dist(p2), 2.8284271247461903);  // sqrt(8)
}

TEST(VectorMathTest, VectorPositionConversion) {
    Position p(1.0, 2.0);
    Vector v(p);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 2.0);

    Vector v2(3.0, 4.0);
    Position p2 = static_cast<Position>(v2);
    EXPECT_DOUBLE_EQ(p2.x, 3.0);
    EXPECT_DOUBLE_EQ(p2.y, 4.0);
}

TEST(VectorMathTest, PositionPlusVector) {
    Position p(1.0, 1.0);
    Vector step(0.5, -2.0);

    p += step;
    EXPECT_DOUBLE_EQ(p.x, 1.5);
    EXPECT_DOUBLE_EQ(p.y, -1.0);
}

TEST(VectorMathTest, Displacement) {
    Vector d = displacement(Position(1.0, 1.0), Position(4.0, 5.0));
    EXPECT_DOUBLE_EQ(d.x, 3.0);
    EXPECT_DOUBLE_EQ(d.y, 4.0);
}

TEST(VectorMathTest, DotProduct) {
    Vector v1(1.0, 2.0);
    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v1.dotProduct(v2), 11.0);  // 1*3 + 2*4
}

TEST(VectorMathTest, ApproximateComparisons) {
    EXPECT_TRUE(nearlyEqual(1.0, 1.0 + 1e-12));
    EXPECT_FALSE(nearlyEqual(1.0, 1.001));

    EXPECT_TRUE(relativelyEqual(1e30, 1e30 * (1.0 + 1e-12)));
    EXPECT_FALSE(relativelyEqual(1e30, 1.01e30));
    EXPECT_TRUE(relativelyEqual(0.0, 1e-12));
}
