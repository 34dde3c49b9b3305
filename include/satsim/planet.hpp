/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_PLANET_HPP
#define __SATSIM_PLANET_HPP

#include <satsim/constants.hpp>

#include <optional>
#include <string>

namespace satsim {

/**
 * Central body of a simulation.
 *
 * A planet is read by every orbit around it on each tick, so it must not be
 * edited while a propagation call is in progress. Between ticks the setters
 * may be used freely. Texture paths are carried for the renderer only.
 */
class Planet {
public:
    /**
     * @throws std::invalid_argument if mu, radius or day is not positive
     */
    Planet(double mu = EARTH_MU,
           double radius = EARTH_RADIUS_KM,
           double day = EARTH_SIDEREAL_DAY,
           std::string name = "Earth",
           std::string imgPath = "assets/earth_4k.jpg",
           std::optional<std::string> nightImgPath = std::nullopt);
    ~Planet() = default;

    double getMu() const;
    double getRadius() const;
    double getDay() const;
    std::string getName() const;
    std::string getImgPath() const;
    std::optional<std::string> getNightImgPath() const;

    void setMu(const double mu);
    void setRadius(const double radius);
    void setDay(const double day);
    void setName(const std::string &name);
    void setImgPath(const std::string &path);
    void setNightImgPath(const std::optional<std::string> &path);

    /**
     * Radius of the circular orbit whose period equals one sidereal day (km).
     */
    double getGeostationaryRadius() const;

    /**
     * One "Key: value" line per field.
     */
    std::string toString() const;

private:
    double mu;
    double radius;
    double day;
    std::string name;
    std::string imgPath;
    std::optional<std::string> nightImgPath;
};

}

#endif
