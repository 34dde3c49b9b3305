/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_KEPLER_HPP
#define __SATSIM_KEPLER_HPP

#include <stdexcept>
#include <string>

namespace satsim {

// ============================================================================
// Orbit Exception Classes
// ============================================================================

/**
 * Base exception class for orbit propagation errors.
 */
class OrbitException : public std::runtime_error {
public:
    explicit OrbitException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when orbital elements are invalid.
 */
class InvalidOrbitElements : public OrbitException {
public:
    explicit InvalidOrbitElements(const std::string& msg) : OrbitException(msg) {}
};

/**
 * Exception thrown when a numerical propagator cannot complete a step.
 */
class PropagationException : public OrbitException {
public:
    explicit PropagationException(const std::string& msg) : OrbitException(msg) {}
};

// ============================================================================
// Keplerian Elements
// ============================================================================

/**
 * Classical orbital elements plus the mean anomaly that places the body on
 * the orbit. Angles are in radians, distances in kilometers.
 */
struct Elements {
    double semiMajorAxis;          ///< a (km)
    double eccentricity;           ///< e, [0, 1)
    double inclination;            ///< i (rad)
    double ascendingNode;          ///< Ω, longitude of the ascending node (rad)
    double argumentOfPeriapsis;    ///< ω (rad)
    double meanAnomaly;            ///< M (rad)
};

/**
 * Checks that an ellipse is usable around a body of the given radius.
 *
 * @throws InvalidOrbitElements if e is outside [0, 1), a <= 0, or the
 *         periapsis a·(1−e) does not clear the body
 */
void validateElements(double semiMajorAxis, double eccentricity, double bodyRadius);

// ============================================================================
// Kepler's Equation
// ============================================================================

/**
 * Result of solving M = E − e·sin(E).
 */
struct KeplerSolution {
    double eccentricAnomaly;   ///< E, [0, 2π)
    double trueAnomaly;        ///< v, [0, 2π)
    int iterations;            ///< Bisection steps taken
};

/**
 * Solves Kepler's equation by bisection over [0, 2π).
 *
 * E − e·sin(E) is strictly increasing for e in [0, 1), so halving the bracket
 * always converges, regardless of eccentricity. The loop stops once the
 * bracket is no wider than the tolerance and the midpoint of the final
 * bracket is returned.
 *
 * @param meanAnomaly M in radians, any value (normalized internally)
 * @param eccentricity e in [0, 1)
 * @param tolerance Bracket width at which to stop (rad)
 * @throws std::invalid_argument if tolerance is not positive
 */
KeplerSolution solveKepler(double meanAnomaly, double eccentricity, double tolerance = 1.0e-6);

/**
 * Upper bound on the bisection steps solveKepler takes: ⌈log2(2π / tolerance)⌉.
 */
int maxKeplerIterations(double tolerance = 1.0e-6);

/**
 * True anomaly from eccentric anomaly, resolving the half-plane from E.
 */
double trueAnomalyFromEccentric(double eccentricAnomaly, double eccentricity);

/**
 * Eccentric anomaly from true anomaly, in [0, 2π).
 */
double eccentricFromTrue(double trueAnomaly, double eccentricity);

/**
 * Mean anomaly from eccentric anomaly, in [0, 2π).
 */
double meanFromEccentric(double eccentricAnomaly, double eccentricity);

}

#endif
