/**
 * @file vector_math.cpp
 * @brief Implementation of 2D vector and position operations
 */

#include "relativity/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
    return std::fabs(a - b) < epsilon;
}

bool relativelyEqual(double a, double b, double relTolerance) {
    double const diff = std::fabs(a - b);
    double const largest = std::max(std::fabs(a), std::fabs(b));
    if (largest < EPSILON) {
        return diff < EPSILON;
    }
    return diff <= relTolerance * largest;
}

// ---------------------------------------------------------------------------
// Position
// ---------------------------------------------------------------------------

Position::Position() : x(0.0), y(0.0) {}

Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Position& b) const {
    return Position(x + b.x, y + b.y);
}

Position Position::operator-(const Position& b) const {
    return Position(x - b.x, y - b.y);
}

Position Position::operator*(double scalar) const {
    return Position(x * scalar, y * scalar);
}

Position Position::operator/(double scalar) const {
    return Position(x / scalar, y / scalar);
}

double Position::dist(const Position& p) const {
    double const dx = x - p.x;
    double const dy = y - p.y;
    return std::sqrt(dx * dx + dy * dy);
}

Position& Position::operator+=(const Position& p) {
    x += p.x;
    y += p.y;
    return *this;
}

Position& Position::operator-=(const Position& p) {
    x -= p.x;
    y -= p.y;
    return *this;
}

// ---------------------------------------------------------------------------
// Vector
// ---------------------------------------------------------------------------

Vector::Vector() : x(0.0), y(0.0) {}

Vector::Vector(double x, double y) : x(x), y(y) {}

Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
    return Position(x, y);
}

Vector Vector::operator-() const {
    return Vector(-x, -y);
}

Vector Vector::operator+(const Vector& b) const {
    return Vector(x + b.x, y + b.y);
}

Vector Vector::operator-(const Vector& b) const {
    return Vector(x - b.x, y - b.y);
}

Vector Vector::operator*(double scalar) const {
    return Vector(x * scalar, y * scalar);
}

Vector Vector::operator/(double scalar) const {
    return Vector(x / scalar, y / scalar);
}

double Vector::length() const {
    return std::sqrt(x * x + y * y);
}

double Vector::lengthSquared() const {
    return x * x + y * y;
}

double Vector::dotProduct(const Vector& v) const {
    return x * v.x + y * v.y;
}

Vector Vector::normalized() const {
    double const len = length();
    if (len == 0.0) {
        return Vector();
    }
    return Vector(x / len, y / len);
}

Vector Vector::scale(double newLength) const {
    return normalized() * newLength;
}

bool Vector::isZero() const {
    return x == 0.0 && y == 0.0;
}

Vector& Vector::operator+=(const Vector& v) {
    x += v.x;
    y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    x -= v.x;
    y -= v.y;
    return *this;
}

Vector& Vector::operator*=(double scalar) {
    x *= scalar;
    y *= scalar;
    return *this;
}

Vector displacement(const Position& from, const Position& to) {
    return Vector(to.x - from.x, to.y - from.y);
}
