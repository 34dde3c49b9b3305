/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_PROPAGATOR_HPP
#define __SATSIM_PROPAGATOR_HPP

#include <satsim/constants.hpp>
#include <satsim/kepler.hpp>
#include <satsim/point.hpp>

#include <iostream>
#include <memory>
#include <string_view>

namespace satsim {

/**
 * Inertial position (km) and velocity (km/s) of a body.
 */
struct StateVector {
    Vec3 position;
    Vec3 velocity;
};

/**
 * Available propagation strategies.
 */
enum class PropagatorType {
    ClosedFormKepler,
    FixedStepRK4,
    AdaptiveRKF78
};

std::ostream& operator<<(std::ostream &os, const PropagatorType &type);

/**
 * Parses "kepler", "rk4" or "rkf78" (case-insensitive).
 * @throws std::invalid_argument for any other name
 */
PropagatorType parsePropagatorType(const std::string_view &name);

// ============================================================================
// Element / State Conversion
// ============================================================================

/**
 * Converts orbital elements to an inertial state vector.
 */
StateVector toStateVector(const Elements &elements, double mu);

/**
 * Recovers osculating elements from an inertial state vector.
 *
 * The node is undefined for equatorial orbits and the periapsis is undefined
 * for circular ones; in those cases the angle is taken from previous so that
 * the argument of latitude stays continuous between steps.
 *
 * @throws InvalidOrbitElements if the state has no angular momentum
 */
Elements toElements(const StateVector &state, double mu, const Elements &previous);

/**
 * Time derivative of a two-body state: (velocity, −μ·r/|r|³).
 */
StateVector twoBodyDerivative(const StateVector &state, double mu);

// ============================================================================
// Propagators
// ============================================================================

/**
 * Strategy that advances a set of elements by a time step.
 *
 * Implementations are stateless, so one instance may be shared between
 * copies of an orbit.
 */
class Propagator {
public:
    virtual ~Propagator() = default;

    virtual PropagatorType type() const = 0;

    /**
     * Advances the elements by dt seconds around a body with parameter mu.
     */
    virtual Elements propagate(const Elements &elements, double mu, double dt) const = 0;
};

/**
 * Closed-form two-body stepping: M ← M + n·dt, all other elements fixed.
 *
 * Two successive steps give the same mean anomaly as one step of their sum.
 */
class KeplerPropagator : public Propagator {
public:
    PropagatorType type() const override { return PropagatorType::ClosedFormKepler; }
    Elements propagate(const Elements &elements, double mu, double dt) const override;
};

/**
 * Classical fourth-order Runge-Kutta on the two-body state, splitting dt into
 * equal sub-steps no longer than maxStepInSeconds.
 */
class RK4Propagator : public Propagator {
public:
    explicit RK4Propagator(double maxStepInSeconds);

    PropagatorType type() const override { return PropagatorType::FixedStepRK4; }
    Elements propagate(const Elements &elements, double mu, double dt) const override;

    /** Integrates the raw state vector. */
    StateVector integrate(const StateVector &state, double mu, double dt) const;

private:
    double maxStep_;
};

/**
 * Runge-Kutta-Fehlberg 7(8) on the two-body state with adaptive step size.
 *
 * Each step evaluates the 13-stage Fehlberg tableau, advances with the
 * eighth-order solution and uses the difference to the seventh-order one as
 * the local error estimate.
 */
class RKF78Propagator : public Propagator {
public:
    RKF78Propagator(double tolerance, double initialStepInSeconds,
                    double minStepInSeconds, int maxSteps);

    PropagatorType type() const override { return PropagatorType::AdaptiveRKF78; }
    Elements propagate(const Elements &elements, double mu, double dt) const override;

    /**
     * Integrates the raw state vector.
     * @throws PropagationException if the step budget runs out
     */
    StateVector integrate(const StateVector &state, double mu, double dt) const;

private:
    double tolerance_;
    double initialStep_;
    double minStep_;
    int maxSteps_;
};

/**
 * Builds the propagator for a strategy using the integrator settings in constants.
 */
std::shared_ptr<const Propagator> makePropagator(PropagatorType type, const Constants &constants);

}

#endif
