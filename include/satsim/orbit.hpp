/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_ORBIT_HPP
#define __SATSIM_ORBIT_HPP

#include <satsim/constants.hpp>
#include <satsim/kepler.hpp>
#include <satsim/planet.hpp>
#include <satsim/point.hpp>
#include <satsim/propagator.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace satsim {

// ============================================================================
// Orbit Class
// ============================================================================

/**
 * A Keplerian orbit around a planet together with the body's current place
 * on it.
 *
 * The mean, eccentric and true anomalies are always recomputed together, so
 * they never disagree. Angles are normalized to [0, 2π) on construction and
 * on every mutation.
 *
 * Usage:
 *   auto earth = std::make_shared<Planet>();
 *   Orbit orbit(earth, 7000.0, 0.001, 0.9006);
 *   orbit.update(60.0);          // J2 drift and drag
 *   orbit.updatePosition(60.0);  // advance the anomalies
 *   Point p = orbit.getPositionPoint();
 *
 * Copies share the planet and the (stateless) propagator but own their
 * elements and anomalies. This class is not thread-safe for the same instance.
 */
class Orbit {
public:
    /**
     * Creates an orbit and places the body according to its epoch (see reset()).
     *
     * @param planet Central body
     * @param semiMajorAxis a (km)
     * @param eccentricity e, [0, 1)
     * @param inclination i (rad)
     * @param ascendingNode Ω (rad)
     * @param argumentOfPeriapsis ω (rad)
     * @param epoch tp (s)
     * @param propagatorType Strategy used by every updatePosition() of this
     *        orbit. It cannot be changed afterwards.
     * @param constants Physical constants and tolerances
     * @throws InvalidOrbitElements if the ellipse is unusable around the planet
     * @throws std::invalid_argument if planet is null
     */
    Orbit(std::shared_ptr<Planet> planet,
          double semiMajorAxis,
          double eccentricity,
          double inclination,
          double ascendingNode = 0.0,
          double argumentOfPeriapsis = 0.0,
          double epoch = 0.0,
          PropagatorType propagatorType = PropagatorType::ClosedFormKepler,
          const Constants &constants = Constants());
    ~Orbit() = default;

    /**
     * Applies first-order perturbations over dt seconds (forward Euler).
     *
     * J2 makes the node drift by rate·cos(i)·dt and the periapsis by
     * rate·(2.5·sin²(i) − 1)·dt, rate = 1.5·n·J2·(R/r)². Below the drag altitude
     * limit an exponential atmosphere slows the auxiliary speed. Only Ω, ω
     * and the auxiliary speed change.
     */
    void update(double dt);

    /**
     * Advances the anomalies by dt seconds with this orbit's propagator.
     *
     * @throws InvalidOrbitElements if a numerical propagator produces an
     *         unusable ellipse
     * @throws PropagationException if the adaptive integrator runs out of steps
     */
    void updatePosition(double dt);

    /**
     * Places the body at its epoch: M = normalize(−n·tp).
     */
    void reset();

    /**
     * Current position as a spherical point (km, rad).
     */
    Point getPositionPoint() const;

    /**
     * Position at an arbitrary mean anomaly, without touching the current state.
     */
    Point getPointAt(double meanAnomaly) const;

    /**
     * Current inertial position and velocity.
     */
    StateVector getStateVector() const;

    /**
     * Current inertial velocity (km/s).
     */
    Vec3 getVelocityVector() const;

    // Accessors for orbital elements
    double getSemiMajorAxis() const;
    double getEccentricity() const;
    double getInclination() const;
    double getAscendingNode() const;
    double getArgumentOfPeriapsis() const;
    double getEpoch() const;
    Elements getElements() const;

    // Accessors for the body's motion
    double getMeanAnomaly() const;
    double getEccentricAnomaly() const;
    double getTrueAnomaly() const;

    /**
     * Auxiliary speed (km/s): vis-viva at the current radius less the
     * speed lost to drag since the last reset.
     */
    double getSpeed() const;

    // Derived quantities
    double getMeanMotion() const;
    double getPeriod() const;
    double getPeriapsisRadius() const;
    double getApoapsisRadius() const;
    double getRadius() const;

    std::shared_ptr<Planet> getPlanet() const;
    const Constants& getConstants() const;
    PropagatorType getPropagatorType() const;

    /**
     * @throws InvalidOrbitElements if the result would be unusable
     */
    void setSemiMajorAxis(const double a);

    /**
     * @throws InvalidOrbitElements if the result would be unusable
     */
    void setEccentricity(const double e);

    void setInclination(const double i);
    void setAscendingNode(const double omega);
    void setArgumentOfPeriapsis(const double omega);
    void setEpoch(const double tp);

    /**
     * Sets M directly and re-derives E and v. Used to restore a stored
     * anomaly without going through reset().
     */
    void setMeanAnomaly(const double m);

    /**
     * Record fields, one "key: value" line each, in the order
     * a, e, i, Omega, omega, tp, M.
     */
    std::string toString() const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

private:
    std::shared_ptr<Planet> planet;
    Constants constants;
    std::shared_ptr<const Propagator> propagator;

    // Elements
    double semiMajorAxis;
    double eccentricity;
    double inclination;
    double ascendingNode;
    double argumentOfPeriapsis;
    double epoch;

    // Motion
    double meanAnomaly = 0.0;
    double eccentricAnomaly = 0.0;
    double trueAnomaly = 0.0;
    double dragSpeedLoss = 0.0;   // km/s

    void applyMeanAnomaly(double m);
    Point positionAt(double ea, double v) const;
    double atmosphericDensity(double altitudeInKilometers) const;
    void applyDrag(double altitudeInKilometers, double dt);
};

}

#endif
