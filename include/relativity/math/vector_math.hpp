/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics
 *
 * - Vector for velocities, accelerations and directions
 * - Position for absolute points in world or screen space
 * - Conversions between the two and the usual geometric helpers
 */

#ifndef RELATIVITY_VECTOR_MATH_HPP
#define RELATIVITY_VECTOR_MATH_HPP

/**
 * @brief Threshold for floating point equality tests
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Compares two doubles for approximate equality
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Relative comparison, falls back to absolute near zero
 * @return true if |a-b| <= relTolerance * max(|a|, |b|) or both are tiny
 */
bool relativelyEqual(double a, double b, double relTolerance = 1e-9);

/**
 * @brief Represents a 2D point in space
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    Position(double x, double y);

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;
    Position operator/(double scalar) const;

    /**
     * @brief Calculates Euclidean distance to another position
     */
    double dist(const Position& p) const;

    Position& operator+=(const Position& p);
    Position& operator-=(const Position& p);
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    Vector(double x, double y);

    /**
     * @brief Constructs a vector from a position
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoids the sqrt */
    double lengthSquared() const;

    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * The zero vector normalizes to the zero vector.
     */
    Vector normalized() const;

    /**
     * @brief Scales vector to specified length, keeping its direction
     */
    Vector scale(double length) const;

    /** @brief True when both components are exactly zero */
    bool isZero() const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);
};

/**
 * @brief Vector pointing from one position to another
 */
Vector displacement(const Position& from, const Position& to);

#endif
