/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_POINT_HPP
#define __SATSIM_POINT_HPP

#include <cmath>
#include <iostream>
#include <variant>

namespace satsim {

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * Inertial vector: a position (km), a velocity (km/s) or a burn direction.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3 &rhs) const {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }

    Vec3 operator-(const Vec3 &rhs) const {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }

    Vec3 operator*(double factor) const {
        return {x * factor, y * factor, z * factor};
    }

    Vec3 operator/(double divisor) const {
        return {x / divisor, y / divisor, z / divisor};
    }

    double dot(const Vec3 &rhs) const {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    // Right-handed: x × y = z
    Vec3 cross(const Vec3 &rhs) const {
        return {y * rhs.z - z * rhs.y, z * rhs.x - x * rhs.z, x * rhs.y - y * rhs.x};
    }

    double squaredMagnitude() const {
        return dot(*this);
    }

    double magnitude() const {
        return std::sqrt(squaredMagnitude());
    }
};

/**
 * Cartesian form of a point (km).
 */
struct Cartesian {
    double x;
    double y;
    double z;
};

/**
 * Spherical (polar) form of a point.
 */
struct Spherical {
    double radius;       ///< Distance from the origin (km), always >= 0
    double azimuth;      ///< Angle in the x-y plane from +x (rad), [0, 2π)
    double elevation;    ///< Angle above the x-y plane (rad)
};

/**
 * Normalizes an angle in radians to [0, 2π).
 */
double normalizeAngle(double angleInRadians);

/**
 * Converts a Cartesian point to its spherical form.
 *
 * The azimuth uses a four-quadrant arctangent and the elevation is
 * asin(z / r). The origin maps to (0, 0, 0).
 */
Spherical toSpherical(const Cartesian& c);

/**
 * Converts a spherical point to its Cartesian form.
 */
Cartesian toCartesian(const Spherical& s);

/**
 * A point in space held in either Cartesian or spherical form.
 *
 * Both forms are readable from any Point; the stored form only decides which
 * values are exact and which are converted on demand. Arithmetic and
 * equality are evaluated component-wise in Cartesian form, and the result of
 * an arithmetic operation keeps the form of the left operand.
 */
class Point {
public:
    Point() : value_(Cartesian{0.0, 0.0, 0.0}) {}
    explicit Point(const Cartesian& c) : value_(c) {}
    explicit Point(const Spherical& s);
    explicit Point(const Vec3& v) : value_(Cartesian{v.x, v.y, v.z}) {}

    static Point cartesian(double x, double y, double z);

    /**
     * @throws std::invalid_argument if radius is negative or not a number
     */
    static Point spherical(double radius, double azimuth, double elevation);

    bool isCartesian() const;
    bool isSpherical() const;

    // Cartesian accessors
    double getX() const;
    double getY() const;
    double getZ() const;

    // Spherical accessors
    double getRadius() const;
    double getAzimuth() const;
    double getElevation() const;

    Cartesian asCartesian() const;
    Spherical asSpherical() const;
    Vec3 toVec3() const;

    /** Same point, stored in Cartesian form. */
    Point toCartesian() const;

    /** Same point, stored in spherical form. */
    Point toSpherical() const;

    Point operator+(const Point& other) const;
    Point operator-(const Point& other) const;
    Point& operator+=(const Point& other);
    Point& operator-=(const Point& other);
    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const;

private:
    std::variant<Cartesian, Spherical> value_;

    Point withForm(const Cartesian& c) const;
};

std::ostream& operator<<(std::ostream &os, const Point &point);

}

#endif
