/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/propagator.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>

#include <spdlog/spdlog.h>

namespace satsim {

using spdlog::debug;

namespace {

// Solving to this width keeps element/state round trips well below the
// integrators' own error.
constexpr double STATE_CONVERSION_TOLERANCE = 1.0e-12;

// Below these magnitudes the node or the periapsis is treated as undefined
constexpr double NODE_EPSILON = 1.0e-11;
constexpr double ECCENTRICITY_EPSILON = 1.0e-10;

StateVector addScaled(const StateVector &y, double h, const StateVector &k) {
    return {y.position + k.position * h, y.velocity + k.velocity * h};
}

// ----------------------------------------------------------------------------
// Runge-Kutta-Fehlberg 7(8) coefficients
// ----------------------------------------------------------------------------

constexpr int RKF78_STAGES = 13;

constexpr double RKF78_A[RKF78_STAGES][RKF78_STAGES - 1] = {
    {},
    {2.0/27.0},
    {1.0/36.0, 1.0/12.0},
    {1.0/24.0, 0.0, 1.0/8.0},
    {5.0/12.0, 0.0, -25.0/16.0, 25.0/16.0},
    {1.0/20.0, 0.0, 0.0, 1.0/4.0, 1.0/5.0},
    {-25.0/108.0, 0.0, 0.0, 125.0/108.0, -65.0/27.0, 125.0/54.0},
    {31.0/300.0, 0.0, 0.0, 0.0, 61.0/225.0, -2.0/9.0, 13.0/900.0},
    {2.0, 0.0, 0.0, -53.0/6.0, 704.0/45.0, -107.0/9.0, 67.0/90.0, 3.0},
    {-91.0/108.0, 0.0, 0.0, 23.0/108.0, -976.0/135.0, 311.0/54.0, -19.0/60.0, 17.0/6.0, -1.0/12.0},
    {2383.0/4100.0, 0.0, 0.0, -341.0/164.0, 4496.0/1025.0, -301.0/82.0, 2133.0/4100.0,
        45.0/82.0, 45.0/164.0, 18.0/41.0},
    {3.0/205.0, 0.0, 0.0, 0.0, 0.0, -6.0/41.0, -3.0/205.0, -3.0/41.0, 3.0/41.0, 6.0/41.0, 0.0},
    {-1777.0/4100.0, 0.0, 0.0, -341.0/164.0, 4496.0/1025.0, -289.0/82.0, 2193.0/4100.0,
        51.0/82.0, 33.0/164.0, 12.0/41.0, 0.0, 1.0}
};

// Eighth-order weights; the seventh-order solution differs from it only by
// 41/840·(k1 + k11 − k12 − k13).
constexpr double RKF78_B8[RKF78_STAGES] = {
    0.0, 0.0, 0.0, 0.0, 0.0, 34.0/105.0, 9.0/35.0, 9.0/35.0, 9.0/280.0, 9.0/280.0,
    0.0, 41.0/840.0, 41.0/840.0
};

constexpr double RKF78_ERROR_WEIGHT = 41.0 / 840.0;

double largestComponent(const StateVector &s) {
    return std::max({
        std::fabs(s.position.x), std::fabs(s.position.y), std::fabs(s.position.z),
        std::fabs(s.velocity.x), std::fabs(s.velocity.y), std::fabs(s.velocity.z)
    });
}

}

std::ostream& operator<<(std::ostream &os, const PropagatorType &type) {
    switch (type) {
        case PropagatorType::ClosedFormKepler:
            os << "kepler";
            break;
        case PropagatorType::FixedStepRK4:
            os << "rk4";
            break;
        case PropagatorType::AdaptiveRKF78:
            os << "rkf78";
            break;
    }
    return os;
}

PropagatorType parsePropagatorType(const std::string_view &name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "kepler") {
        return PropagatorType::ClosedFormKepler;
    } else if (lower == "rk4") {
        return PropagatorType::FixedStepRK4;
    } else if (lower == "rkf78") {
        return PropagatorType::AdaptiveRKF78;
    }
    throw std::invalid_argument("Invalid propagator: " + std::string(name));
}

// ============================================================================
// Element / State Conversion
// ============================================================================

StateVector toStateVector(const Elements &elements, double mu) {
    double a = elements.semiMajorAxis;
    double e = elements.eccentricity;
    double ea = solveKepler(elements.meanAnomaly, e, STATE_CONVERSION_TOLERANCE).eccentricAnomaly;

    double cosE = std::cos(ea);
    double sinE = std::sin(ea);
    double rootOneMinusE2 = std::sqrt(1.0 - e * e);
    double n = std::sqrt(mu / (a * a * a));
    double denominator = 1.0 - e * cosE;

    // Position and velocity in the perifocal frame
    double xPf = a * (cosE - e);
    double yPf = a * rootOneMinusE2 * sinE;
    double vxPf = -a * n * sinE / denominator;
    double vyPf = a * n * rootOneMinusE2 * cosE / denominator;

    double cosO = std::cos(elements.ascendingNode);
    double sinO = std::sin(elements.ascendingNode);
    double cosI = std::cos(elements.inclination);
    double sinI = std::sin(elements.inclination);
    double cosW = std::cos(elements.argumentOfPeriapsis);
    double sinW = std::sin(elements.argumentOfPeriapsis);

    // R = R3(-Ω) * R1(-i) * R3(-ω)
    double r11 = cosO * cosW - sinO * sinW * cosI;
    double r12 = -cosO * sinW - sinO * cosW * cosI;
    double r21 = sinO * cosW + cosO * sinW * cosI;
    double r22 = -sinO * sinW + cosO * cosW * cosI;
    double r31 = sinW * sinI;
    double r32 = cosW * sinI;

    StateVector state;
    state.position = {r11 * xPf + r12 * yPf, r21 * xPf + r22 * yPf, r31 * xPf + r32 * yPf};
    state.velocity = {r11 * vxPf + r12 * vyPf, r21 * vxPf + r22 * vyPf, r31 * vxPf + r32 * vyPf};
    return state;
}

Elements toElements(const StateVector &state, double mu, const Elements &previous) {
    const Vec3 &r = state.position;
    const Vec3 &v = state.velocity;

    double rMag = r.magnitude();
    double v2 = v.squaredMagnitude();
    double rv = r.dot(v);

    Vec3 h = r.cross(v);
    double hMag = h.magnitude();
    if (!(hMag > 0.0) || !(rMag > 0.0)) {
        throw InvalidOrbitElements("State vector has no angular momentum");
    }

    Elements elements;
    elements.semiMajorAxis = 1.0 / (2.0 / rMag - v2 / mu);

    Vec3 eVec = (r * (v2 - mu / rMag) - v * rv) / mu;
    double e = eVec.magnitude();
    elements.eccentricity = e;

    double i = std::acos(std::clamp(h.z / hMag, -1.0, 1.0));
    elements.inclination = i;

    // Node vector k × h
    double nodeX = -h.y;
    double nodeY = h.x;
    if (std::hypot(nodeX, nodeY) > NODE_EPSILON * hMag) {
        elements.ascendingNode = normalizeAngle(std::atan2(nodeY, nodeX));
    } else {
        elements.ascendingNode = previous.ascendingNode;
    }

    // Argument of latitude, measured in the orbital plane from the node
    double cosO = std::cos(elements.ascendingNode);
    double sinO = std::sin(elements.ascendingNode);
    double xNode = r.x * cosO + r.y * sinO;
    double yNode = -r.x * sinO + r.y * cosO;
    double u = std::atan2(yNode * std::cos(i) + r.z * std::sin(i), xNode);

    double trueAnomaly;
    if (e > ECCENTRICITY_EPSILON) {
        double p = hMag * hMag / mu;
        trueAnomaly = std::atan2(rv * hMag / (mu * rMag), p / rMag - 1.0);
        elements.argumentOfPeriapsis = normalizeAngle(u - trueAnomaly);
    } else {
        elements.argumentOfPeriapsis = previous.argumentOfPeriapsis;
        trueAnomaly = u - previous.argumentOfPeriapsis;
    }

    double ea = eccentricFromTrue(trueAnomaly, std::min(e, 1.0 - ECCENTRICITY_EPSILON));
    elements.meanAnomaly = meanFromEccentric(ea, e);
    return elements;
}

StateVector twoBodyDerivative(const StateVector &state, double mu) {
    double r = state.position.magnitude();
    double factor = -mu / (r * r * r);
    return {state.velocity, state.position * factor};
}

// ============================================================================
// Closed-Form Kepler
// ============================================================================

Elements KeplerPropagator::propagate(const Elements &elements, double mu, double dt) const {
    double a = elements.semiMajorAxis;
    double n = std::sqrt(mu / (a * a * a));

    Elements result = elements;
    result.meanAnomaly = normalizeAngle(elements.meanAnomaly + n * dt);
    return result;
}

// ============================================================================
// Fixed-Step RK4
// ============================================================================

RK4Propagator::RK4Propagator(double maxStepInSeconds) : maxStep_(maxStepInSeconds) {
    if (!(maxStepInSeconds > 0.0)) {
        throw std::invalid_argument("RK4 step must be positive: " + std::to_string(maxStepInSeconds));
    }
}

StateVector RK4Propagator::integrate(const StateVector &state, double mu, double dt) const {
    if (dt == 0.0) {
        return state;
    }

    int steps = static_cast<int>(std::ceil(std::fabs(dt) / maxStep_));
    double h = dt / steps;

    StateVector y = state;
    for (int step = 0; step < steps; ++step) {
        StateVector k1 = twoBodyDerivative(y, mu);
        StateVector k2 = twoBodyDerivative(addScaled(y, 0.5 * h, k1), mu);
        StateVector k3 = twoBodyDerivative(addScaled(y, 0.5 * h, k2), mu);
        StateVector k4 = twoBodyDerivative(addScaled(y, h, k3), mu);

        y.position = y.position + (k1.position + k2.position * 2.0 + k3.position * 2.0 + k4.position) * (h / 6.0);
        y.velocity = y.velocity + (k1.velocity + k2.velocity * 2.0 + k3.velocity * 2.0 + k4.velocity) * (h / 6.0);
    }
    return y;
}

Elements RK4Propagator::propagate(const Elements &elements, double mu, double dt) const {
    StateVector state = integrate(toStateVector(elements, mu), mu, dt);
    return toElements(state, mu, elements);
}

// ============================================================================
// Adaptive RKF78
// ============================================================================

RKF78Propagator::RKF78Propagator(double tolerance, double initialStepInSeconds,
                                 double minStepInSeconds, int maxSteps)
    : tolerance_(tolerance),
      initialStep_(initialStepInSeconds),
      minStep_(minStepInSeconds),
      maxSteps_(maxSteps) {
    if (!(tolerance > 0.0) || !(initialStepInSeconds > 0.0) || !(minStepInSeconds > 0.0) || maxSteps <= 0) {
        throw std::invalid_argument("RKF78 settings must be positive");
    }
}

StateVector RKF78Propagator::integrate(const StateVector &state, double mu, double dt) const {
    StateVector y = state;
    double remaining = dt;
    double direction = dt < 0.0 ? -1.0 : 1.0;
    double h = direction * std::min(initialStep_, std::fabs(dt));
    int attempts = 0;

    std::array<StateVector, RKF78_STAGES> k;

    while (remaining != 0.0) {
        if (++attempts > maxSteps_) {
            throw PropagationException(fmt::format(
                "RKF78 exceeded {} steps with {:.6f} s left to integrate", maxSteps_, remaining));
        }

        // Never step past the end; the last step lands exactly on it
        if (std::fabs(h) >= std::fabs(remaining)) {
            h = remaining;
        }

        for (int stage = 0; stage < RKF78_STAGES; ++stage) {
            StateVector ys = y;
            for (int j = 0; j < stage; ++j) {
                if (RKF78_A[stage][j] != 0.0) {
                    ys = addScaled(ys, h * RKF78_A[stage][j], k[j]);
                }
            }
            k[stage] = twoBodyDerivative(ys, mu);
        }

        StateVector errorVector{{0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
        errorVector = addScaled(errorVector, h * RKF78_ERROR_WEIGHT, k[0]);
        errorVector = addScaled(errorVector, h * RKF78_ERROR_WEIGHT, k[10]);
        errorVector = addScaled(errorVector, -h * RKF78_ERROR_WEIGHT, k[11]);
        errorVector = addScaled(errorVector, -h * RKF78_ERROR_WEIGHT, k[12]);
        double error = largestComponent(errorVector);

        bool atMinimum = std::fabs(h) <= minStep_;
        if (error <= tolerance_ || atMinimum) {
            for (int stage = 0; stage < RKF78_STAGES; ++stage) {
                if (RKF78_B8[stage] != 0.0) {
                    y = addScaled(y, h * RKF78_B8[stage], k[stage]);
                }
            }
            remaining -= h;
            if (error > tolerance_) {
                debug("RKF78 accepted step of {:.3e} s at minimum size with error {:.3e}", h, error);
            }
        } else {
            debug("RKF78 rejected step of {:.3e} s with error {:.3e}", h, error);
        }

        double factor = 4.0;
        if (error > 0.0) {
            factor = std::clamp(0.9 * std::pow(tolerance_ / error, 1.0 / 8.0), 0.2, 4.0);
        }
        h *= factor;
        if (std::fabs(h) < minStep_) {
            h = direction * minStep_;
        }
    }
    return y;
}

Elements RKF78Propagator::propagate(const Elements &elements, double mu, double dt) const {
    StateVector state = integrate(toStateVector(elements, mu), mu, dt);
    return toElements(state, mu, elements);
}

std::shared_ptr<const Propagator> makePropagator(PropagatorType type, const Constants &constants) {
    switch (type) {
        case PropagatorType::FixedStepRK4:
            return std::make_shared<RK4Propagator>(constants.rk4StepInSeconds);
        case PropagatorType::AdaptiveRKF78:
            return std::make_shared<RKF78Propagator>(
                constants.rkf78Tolerance,
                constants.rkf78InitialStepInSeconds,
                constants.rkf78MinStepInSeconds,
                constants.rkf78MaxSteps);
        case PropagatorType::ClosedFormKepler:
            break;
    }
    return std::make_shared<KeplerPropagator>();
}

}
