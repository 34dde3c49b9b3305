/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_SATELLITE_HPP
#define __SATSIM_SATELLITE_HPP

#include <satsim/orbit.hpp>
#include <satsim/planet.hpp>
#include <satsim/point.hpp>
#include <satsim/propulsion.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace satsim {

// ============================================================================
// Command-line Satellites
// ============================================================================

/**
 * A satellite described on the command line as "name:a:e:i:Omega:omega:tp".
 * Angles are stored in radians.
 */
struct SatelliteSpec {
    std::string name;
    double semiMajorAxis;           ///< km
    double eccentricity;
    double inclination;             ///< rad
    double ascendingNode;           ///< rad
    double argumentOfPeriapsis;     ///< rad
    double epoch;                   ///< s
};

/**
 * Parses "name:a:e:i:Omega:omega:tp" with the three angles given in degrees.
 * The epoch may be omitted and defaults to 0.
 *
 * @throws std::invalid_argument if the string is malformed
 */
SatelliteSpec parseSatelliteSpec(const std::string_view &specStr);

// ============================================================================
// Satellite Class
// ============================================================================

/**
 * A named spacecraft on its own copy of an orbit.
 *
 * The attitude angles only matter to renderers; they do not affect the physics.
 */
class Satellite {
public:
    /**
     * Builds the satellite's orbit from the elements of a prototype orbit,
     * placed around planet and reset to its epoch.
     *
     * @param prototype Orbit whose elements, propagator and constants are copied
     * @param planet Central body
     * @param propulsion Optional propulsion system. The satellite keeps its
     *        own copy, so its mission clock only advances with this satellite.
     * @param name Satellite name
     * @throws InvalidOrbitElements if the elements do not fit around planet
     */
    Satellite(const Orbit &prototype,
              std::shared_ptr<Planet> planet,
              std::optional<Propulsion> propulsion = std::nullopt,
              std::string name = "");
    ~Satellite() = default;

    /**
     * Builds a satellite from a parsed command-line description.
     */
    static Satellite fromSpec(const SatelliteSpec &spec,
                              std::shared_ptr<Planet> planet,
                              PropagatorType propagatorType = PropagatorType::ClosedFormKepler,
                              const Constants &constants = Constants());

    /**
     * Advances one tick: perturbations, then the anomalies, then any
     * maneuvers that have come due.
     */
    void update(double dt);

    /**
     * Returns the orbit to its epoch and restarts the propulsion mission clock.
     */
    void reset();

    Point getCurrentPosition() const;

    Orbit& getOrbit();
    const Orbit& getOrbit() const;
    std::shared_ptr<Planet> getPlanet() const;

    /**
     * @return the satellite's propulsion system, or nullptr if it has none
     */
    Propulsion* getPropulsion();
    const Propulsion* getPropulsion() const;

    std::string getName() const;
    void setName(const std::string &name);

    double getRx() const;
    void setRx(const double rx);
    double getRy() const;
    void setRy(const double ry);
    double getRz() const;
    void setRz(const double rz);

    /**
     * Separator line, the name, then the orbit record fields.
     */
    std::string toString() const;

    /**
     * Print satellite information to a stream.
     */
    void printInfo(std::ostream &os) const;

private:
    Orbit orbit;
    std::shared_ptr<Planet> planet;
    std::optional<Propulsion> propulsion;
    std::string name;

    double rx = 0.0;
    double ry = 0.0;
    double rz = 0.0;
};

}

#endif
