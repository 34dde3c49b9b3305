/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/point.hpp>
#include <satsim/constants.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace satsim {

double normalizeAngle(double angleInRadians) {
    double result = std::fmod(angleInRadians, TWO_PI);
    if (result < 0.0) {
        result += TWO_PI;
    }
    // A tiny negative input rounds up to exactly 2π
    if (result >= TWO_PI) {
        result = 0.0;
    }
    return result;
}

Spherical toSpherical(const Cartesian& c) {
    double r = std::sqrt(c.x * c.x + c.y * c.y + c.z * c.z);
    if (r == 0.0) {
        return {0.0, 0.0, 0.0};
    }

    double azimuth = 0.0;
    if (c.x != 0.0 || c.y != 0.0) {
        azimuth = normalizeAngle(std::atan2(c.y, c.x));
    }

    double elevation = std::asin(std::clamp(c.z / r, -1.0, 1.0));

    return {r, azimuth, elevation};
}

Cartesian toCartesian(const Spherical& s) {
    double cosElevation = std::cos(s.elevation);
    return {
        s.radius * std::cos(s.azimuth) * cosElevation,
        s.radius * std::sin(s.azimuth) * cosElevation,
        s.radius * std::sin(s.elevation)
    };
}

Point::Point(const Spherical& s) : value_(s) {
    if (!(s.radius >= 0.0)) {
        throw std::invalid_argument("Radius must be non-negative: " + std::to_string(s.radius));
    }
    std::get<Spherical>(value_).azimuth = normalizeAngle(s.azimuth);
}

Point Point::cartesian(double x, double y, double z) {
    return Point(Cartesian{x, y, z});
}

Point Point::spherical(double radius, double azimuth, double elevation) {
    return Point(Spherical{radius, azimuth, elevation});
}

bool Point::isCartesian() const {
    return std::holds_alternative<Cartesian>(value_);
}

bool Point::isSpherical() const {
    return std::holds_alternative<Spherical>(value_);
}

Cartesian Point::asCartesian() const {
    if (auto c = std::get_if<Cartesian>(&value_)) {
        return *c;
    }
    return satsim::toCartesian(std::get<Spherical>(value_));
}

Spherical Point::asSpherical() const {
    if (auto s = std::get_if<Spherical>(&value_)) {
        return *s;
    }
    return satsim::toSpherical(std::get<Cartesian>(value_));
}

double Point::getX() const {
    return asCartesian().x;
}

double Point::getY() const {
    return asCartesian().y;
}

double Point::getZ() const {
    return asCartesian().z;
}

double Point::getRadius() const {
    return asSpherical().radius;
}

double Point::getAzimuth() const {
    return asSpherical().azimuth;
}

double Point::getElevation() const {
    return asSpherical().elevation;
}

Vec3 Point::toVec3() const {
    auto c = asCartesian();
    return {c.x, c.y, c.z};
}

Point Point::toCartesian() const {
    return Point(asCartesian());
}

Point Point::toSpherical() const {
    return Point(asSpherical());
}

Point Point::withForm(const Cartesian& c) const {
    if (isCartesian()) {
        return Point(c);
    }
    return Point(satsim::toSpherical(c));
}

Point Point::operator+(const Point& other) const {
    auto a = asCartesian();
    auto b = other.asCartesian();
    return withForm({a.x + b.x, a.y + b.y, a.z + b.z});
}

Point Point::operator-(const Point& other) const {
    auto a = asCartesian();
    auto b = other.asCartesian();
    return withForm({a.x - b.x, a.y - b.y, a.z - b.z});
}

Point& Point::operator+=(const Point& other) {
    *this = *this + other;
    return *this;
}

Point& Point::operator-=(const Point& other) {
    *this = *this - other;
    return *this;
}

bool Point::operator==(const Point& other) const {
    auto a = asCartesian();
    auto b = other.asCartesian();
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

bool Point::operator!=(const Point& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream &os, const Point &point) {
    auto c = point.asCartesian();
    auto s = point.asSpherical();
    os << "[x,y,z] = [" << c.x << "," << c.y << "," << c.z << "] "
       << "[r,az,el] = [" << s.radius << "," << s.azimuth << "," << s.elevation << "]";
    return os;
}

}
