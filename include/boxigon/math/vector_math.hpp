/**
 * @file vector_math.hpp
 * @brief 2D vector and rigid transform mathematics
 *
 * This file provides the fundamental 2D primitives used throughout the engine:
 * - Vector class for points, directions and velocities
 * - Scalar/vector cross product helpers used by the impulse solvers
 * - Transform (translation + rotation) for moving shapes between frames
 */

#pragma once

#include <cmath>

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Represents a 2D vector
 *
 * Used for positions, directions, velocities, forces and impulses alike.
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    bool operator==(const Vector& v) const;
    bool operator!=(const Vector& v) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude (no square root) */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates 2D cross product with another vector
     * @param other Other vector
     * @return Cross product value (z-component)
     */
    double cross(const Vector &other) const;

    /** @brief Returns normalized vector (length = 1), or (1,0) for a zero vector */
    Vector normalized() const;

    /** @brief True when both components are finite numbers */
    bool isFinite() const;
};

/**
 * @brief Cross product of a scalar (z-axis vector) with a vector: s x v
 *
 * Used to turn an angular velocity into the tangential velocity of an offset.
 */
inline Vector crossSV(double s, const Vector& v) {
    return {-s * v.y, s * v.x};
}

/**
 * @brief Cross product of a vector with a scalar (z-axis vector): v x s
 */
inline Vector crossVS(const Vector& v, double s) {
    return {s * v.y, -s * v.x};
}

/**
 * @brief Squared distance between two points
 */
inline double distanceSquared(const Vector& a, const Vector& b) {
    double const dx = b.x - a.x;
    double const dy = b.y - a.y;
    return dx * dx + dy * dy;
}

/**
 * @brief Rigid transform: rotation (stored as cosine/sine) followed by translation
 */
struct Transform {
    Vector p;        ///< Translation
    double c = 1.0;  ///< cos(angle)
    double s = 0.0;  ///< sin(angle)

    Transform() = default;
    Transform(const Vector& position, double angle)
        : p(position), c(std::cos(angle)), s(std::sin(angle)) {}

    /** @brief Rotates a local direction into world space */
    Vector rotate(const Vector& v) const {
        return {c * v.x - s * v.y, s * v.x + c * v.y};
    }

    /** @brief Rotates a world direction into local space */
    Vector invRotate(const Vector& v) const {
        return {c * v.x + s * v.y, -s * v.x + c * v.y};
    }

    /** @brief Maps a local point into world space */
    Vector apply(const Vector& v) const {
        return rotate(v) + p;
    }

    /** @brief Maps a world point into local space */
    Vector applyInverse(const Vector& v) const {
        return invRotate(v - p);
    }
};
