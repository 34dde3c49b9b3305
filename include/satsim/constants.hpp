/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_CONSTANTS_HPP
#define __SATSIM_CONSTANTS_HPP

#include <numbers>

namespace satsim {

// ============================================================================
// Numerical Constants
// ============================================================================

constexpr double PI = std::numbers::pi;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / PI;

// ============================================================================
// Physical Constants
// ============================================================================

constexpr double EARTH_MU = 398600.4415;          // Earth gravitational parameter (km³/s²)
constexpr double EARTH_RADIUS_KM = 6378.1366;     // Earth equatorial radius (km)
constexpr double EARTH_SIDEREAL_DAY = 86164.10;   // Duration of one Earth rotation (s)
constexpr double EARTH_J2 = 0.0010826359;         // Second gravitational zonal harmonic
constexpr double STANDARD_GRAVITY = 9.81;         // Standard gravity (m/s²)

constexpr double METERS_PER_KILOMETER = 1000.0;

// ============================================================================
// Simulation Limits
// ============================================================================

constexpr double MIN_PLANET_RADIUS = 0.1;     // km
constexpr double MAX_PLANET_RADIUS = 1.0e6;   // km
constexpr double MIN_PLANET_MU = 0.001;       // km³/s²
constexpr double MAX_PLANET_MU = 1.0e9;       // km³/s²
constexpr double MIN_PLANET_DAY = 1.0;        // s
constexpr double MAX_PLANET_DAY = 1.0e8;      // s
constexpr double MIN_TIME_STEP = 0.001;       // s
constexpr double MAX_TIME_STEP = 60.0;        // s

/**
 * Physical constants and numeric tolerances used by the propagation engine.
 *
 * A Constants value is handed to each Orbit at construction and copied with
 * it. Nothing in the engine reads process-wide mutable state.
 */
struct Constants {
    double j2 = EARTH_J2;                          ///< Central body J2 coefficient
    double standardGravity = STANDARD_GRAVITY;     ///< g0 for the rocket equation (m/s²)

    double keplerTolerance = 1.0e-6;               ///< Bisection bracket width (rad)

    // Exponential atmosphere and drag
    double dragAltitudeLimitInKilometers = 1000.0; ///< No drag above this altitude
    double seaLevelDensity = 1.225;                ///< Reference density (kg/m³)
    double scaleHeightInKilometers = 8.5;          ///< Density scale height (km)
    double dragCoefficient = 2.2;                  ///< Cd
    double dragAreaInSquareMeters = 1.0;           ///< Cross-sectional area (m²)
    double massInKilograms = 1000.0;               ///< Spacecraft mass (kg)

    // Numerical integrators
    double rk4StepInSeconds = 10.0;                ///< Largest RK4 sub-step (s)
    double rkf78Tolerance = 1.0e-9;                ///< RKF78 local error bound (km)
    double rkf78InitialStepInSeconds = 60.0;       ///< First RKF78 trial step (s)
    double rkf78MinStepInSeconds = 1.0e-6;         ///< Smallest RKF78 step (s)
    int rkf78MaxSteps = 100000;                    ///< RKF78 step budget per call
};

}

#endif
