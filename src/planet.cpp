/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/planet.hpp>

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace satsim {

namespace {

double requirePositive(const double value, const char *field) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(std::string("Planet ") + field + " must be positive: " + std::to_string(value));
    }
    return value;
}

}

Planet::Planet(double mu, double radius, double day, std::string name,
               std::string imgPath, std::optional<std::string> nightImgPath)
    : mu(requirePositive(mu, "mu")),
      radius(requirePositive(radius, "radius")),
      day(requirePositive(day, "day")),
      name(std::move(name)),
      imgPath(std::move(imgPath)),
      nightImgPath(std::move(nightImgPath)) {}

double Planet::getMu() const {
    return mu;
}

double Planet::getRadius() const {
    return radius;
}

double Planet::getDay() const {
    return day;
}

std::string Planet::getName() const {
    return name;
}

std::string Planet::getImgPath() const {
    return imgPath;
}

std::optional<std::string> Planet::getNightImgPath() const {
    return nightImgPath;
}

void Planet::setMu(const double m) {
    mu = requirePositive(m, "mu");
}

void Planet::setRadius(const double r) {
    radius = requirePositive(r, "radius");
}

void Planet::setDay(const double d) {
    day = requirePositive(d, "day");
}

void Planet::setName(const std::string &n) {
    name = n;
}

void Planet::setImgPath(const std::string &path) {
    imgPath = path;
}

void Planet::setNightImgPath(const std::optional<std::string> &path) {
    nightImgPath = path;
}

double Planet::getGeostationaryRadius() const {
    return std::cbrt(mu * day * day / (4.0 * PI * PI));
}

std::string Planet::toString() const {
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    os << "Name: " << name << "\n";
    os << "Radius: " << radius << "\n";
    os << "Mu: " << mu << "\n";
    os << "Day: " << day << "\n";
    os << "ImgPath: " << imgPath << "\n";
    os << "NightImgPath: " << nightImgPath.value_or("") << "\n";
    return os.str();
}

}
