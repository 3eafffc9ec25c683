/**
 * @file vector_math.hpp
 * @brief 2D vector mathematics for screen-space simulation
 *
 * Provides the Vector type used for headings, offsets and steering:
 * - Arithmetic and scaling
 * - Dot product and perpendicular
 * - Unit vector from a heading
 * - Signed steering angle between two directions
 */

#ifndef BYTEPATH_VECTOR_MATH_HPP
#define BYTEPATH_VECTOR_MATH_HPP

/**
 * @brief Represents a 2D vector in screen space (y grows downward)
 */
class Vector {
public:
    float x;  ///< X component
    float y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(float x, float y);

    /**
     * @brief Unit vector pointing along a heading
     * @param radians Heading angle in radians
     */
    static Vector fromAngle(float radians);

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(float scalar) const;
    Vector operator/(float scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);

    /** @brief Returns vector magnitude */
    float length() const;

    /**
     * @brief Distance between the points this and p
     */
    float distance(const Vector& p) const;

    /**
     * @brief Calculates dot product with another vector
     */
    float dotProduct(const Vector& v) const;

    /** @brief Returns perpendicular vector (rotated +90 degrees) */
    Vector perp() const;

    /** @brief Returns normalized vector; (1,0) for a zero-length vector */
    Vector normalized() const;

    /**
     * @brief Unsigned angle between this and another vector, in [0, pi]
     */
    float angleBetween(const Vector& other) const;
};

/**
 * @brief Signed angle needed to turn a heading toward a direction
 *
 * The magnitude is the unsigned angle between the heading and the target
 * direction. The sign is positive when the target lies on the heading's
 * right-hand side (the side of heading + pi/2).
 *
 * @param heading Current heading angle in radians
 * @param toTarget Direction to the target, any length
 * @return Signed angle in [-pi, pi]
 */
float signedSteeringAngle(float heading, const Vector& toTarget);

#endif
