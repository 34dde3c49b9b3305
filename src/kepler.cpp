/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/kepler.hpp>
#include <satsim/constants.hpp>
#include <satsim/point.hpp>

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace satsim {

void validateElements(double semiMajorAxis, double eccentricity, double bodyRadius) {
    if (!(eccentricity >= 0.0 && eccentricity < 1.0)) {
        throw InvalidOrbitElements(fmt::format("Eccentricity must be in [0, 1): {}", eccentricity));
    }
    if (!(semiMajorAxis > 0.0)) {
        throw InvalidOrbitElements(fmt::format("Semi-major axis must be positive: {} km", semiMajorAxis));
    }
    double periapsis = semiMajorAxis * (1.0 - eccentricity);
    if (!(periapsis > bodyRadius)) {
        throw InvalidOrbitElements(fmt::format(
            "Periapsis {:.3f} km does not clear the central body radius {:.3f} km",
            periapsis, bodyRadius));
    }
}

KeplerSolution solveKepler(double meanAnomaly, double eccentricity, double tolerance) {
    if (!(tolerance > 0.0)) {
        throw std::invalid_argument(fmt::format("Kepler tolerance must be positive: {}", tolerance));
    }

    double m = normalizeAngle(meanAnomaly);
    double lower = 0.0;
    double upper = TWO_PI;
    int iterations = 0;

    while ((upper - lower) > tolerance) {
        double mid = 0.5 * (lower + upper);
        // Bracket can no longer shrink in double precision
        if (mid <= lower || mid >= upper) {
            break;
        }
        if (m < mid - eccentricity * std::sin(mid)) {
            upper = mid;
        } else {
            lower = mid;
        }
        ++iterations;
    }

    double e = normalizeAngle(0.5 * (lower + upper));
    return {e, trueAnomalyFromEccentric(e, eccentricity), iterations};
}

int maxKeplerIterations(double tolerance) {
    return static_cast<int>(std::ceil(std::log2(TWO_PI / tolerance)));
}

double trueAnomalyFromEccentric(double eccentricAnomaly, double eccentricity) {
    double e = normalizeAngle(eccentricAnomaly);
    double cosE = std::cos(e);
    double cosV = std::clamp((cosE - eccentricity) / (1.0 - eccentricity * cosE), -1.0, 1.0);
    double v = std::acos(cosV);

    // acos only covers [0, π]; the descending half follows E past π
    if (e <= PI) {
        return v;
    }
    return normalizeAngle(TWO_PI - v);
}

double eccentricFromTrue(double trueAnomaly, double eccentricity) {
    double sinE = std::sqrt(1.0 - eccentricity * eccentricity) * std::sin(trueAnomaly);
    double cosE = eccentricity + std::cos(trueAnomaly);
    return normalizeAngle(std::atan2(sinE, cosE));
}

double meanFromEccentric(double eccentricAnomaly, double eccentricity) {
    return normalizeAngle(eccentricAnomaly - eccentricity * std::sin(eccentricAnomaly));
}

}
