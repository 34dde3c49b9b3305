/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/orbit.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace satsim {

using spdlog::debug;

Orbit::Orbit(std::shared_ptr<Planet> p,
             double a,
             double e,
             double i,
             double node,
             double periapsis,
             double tp,
             PropagatorType propagatorType,
             const Constants &c)
    : planet(std::move(p)),
      constants(c),
      propagator(makePropagator(propagatorType, c)),
      semiMajorAxis(a),
      eccentricity(e),
      inclination(normalizeAngle(i)),
      ascendingNode(normalizeAngle(node)),
      argumentOfPeriapsis(normalizeAngle(periapsis)),
      epoch(tp) {
    if (!planet) {
        throw std::invalid_argument("Orbit requires a planet");
    }
    validateElements(semiMajorAxis, eccentricity, planet->getRadius());
    reset();
}

// ============================================================================
// Propagation
// ============================================================================

void Orbit::applyMeanAnomaly(double m) {
    auto solution = solveKepler(m, eccentricity, constants.keplerTolerance);
    meanAnomaly = normalizeAngle(m);
    eccentricAnomaly = solution.eccentricAnomaly;
    trueAnomaly = solution.trueAnomaly;
}

void Orbit::reset() {
    applyMeanAnomaly(-getMeanMotion() * epoch);
    dragSpeedLoss = 0.0;
}

void Orbit::updatePosition(double dt) {
    Elements next = propagator->propagate(getElements(), planet->getMu(), dt);

    if (next.semiMajorAxis != semiMajorAxis || next.eccentricity != eccentricity) {
        validateElements(next.semiMajorAxis, next.eccentricity, planet->getRadius());
        semiMajorAxis = next.semiMajorAxis;
        eccentricity = next.eccentricity;
    }
    inclination = normalizeAngle(next.inclination);
    ascendingNode = normalizeAngle(next.ascendingNode);
    argumentOfPeriapsis = normalizeAngle(next.argumentOfPeriapsis);
    applyMeanAnomaly(next.meanAnomaly);
}

void Orbit::update(double dt) {
    double r = getRadius();
    double bodyRadius = planet->getRadius();

    // J2 drift of the node and of the periapsis
    double ratio = bodyRadius / r;
    double rate = 1.5 * getMeanMotion() * constants.j2 * ratio * ratio;
    double sinI = std::sin(inclination);

    ascendingNode = normalizeAngle(ascendingNode + rate * std::cos(inclination) * dt);
    argumentOfPeriapsis = normalizeAngle(argumentOfPeriapsis + rate * (2.5 * sinI * sinI - 1.0) * dt);

    double altitude = r - bodyRadius;
    if (altitude < constants.dragAltitudeLimitInKilometers) {
        applyDrag(altitude, dt);
    }
}

double Orbit::atmosphericDensity(double altitudeInKilometers) const {
    return constants.seaLevelDensity * std::exp(-altitudeInKilometers / constants.scaleHeightInKilometers);
}

void Orbit::applyDrag(double altitudeInKilometers, double dt) {
    double rho = atmosphericDensity(altitudeInKilometers);    // kg/m³
    double speed = getSpeed() * METERS_PER_KILOMETER;         // m/s

    // a = ½·Cd·A·ρ·v²/m in m/s²
    double deceleration = 0.5 * constants.dragCoefficient * constants.dragAreaInSquareMeters
                          * rho * speed * speed / constants.massInKilograms;

    dragSpeedLoss += deceleration * dt / METERS_PER_KILOMETER;
    debug("Drag at {:.1f} km: density {:.3e} kg/m³, deceleration {:.3e} m/s²",
          altitudeInKilometers, rho, deceleration);
}

// ============================================================================
// Positions
// ============================================================================

Point Orbit::positionAt(double ea, double v) const {
    double r = semiMajorAxis * (1.0 - eccentricity * std::cos(ea));
    double u = argumentOfPeriapsis + v;

    double azimuth = normalizeAngle(ascendingNode + std::atan2(std::sin(u) * std::cos(inclination), std::cos(u)));
    double elevation = normalizeAngle(std::asin(std::sin(inclination) * std::sin(u)));

    return Point::spherical(r, azimuth, elevation);
}

Point Orbit::getPositionPoint() const {
    return positionAt(eccentricAnomaly, trueAnomaly);
}

Point Orbit::getPointAt(double m) const {
    auto solution = solveKepler(m, eccentricity, constants.keplerTolerance);
    return positionAt(solution.eccentricAnomaly, solution.trueAnomaly);
}

StateVector Orbit::getStateVector() const {
    return toStateVector(getElements(), planet->getMu());
}

Vec3 Orbit::getVelocityVector() const {
    return getStateVector().velocity;
}

// ============================================================================
// Accessors
// ============================================================================

double Orbit::getSemiMajorAxis() const {
    return semiMajorAxis;
}

double Orbit::getEccentricity() const {
    return eccentricity;
}

double Orbit::getInclination() const {
    return inclination;
}

double Orbit::getAscendingNode() const {
    return ascendingNode;
}

double Orbit::getArgumentOfPeriapsis() const {
    return argumentOfPeriapsis;
}

double Orbit::getEpoch() const {
    return epoch;
}

Elements Orbit::getElements() const {
    return {semiMajorAxis, eccentricity, inclination, ascendingNode, argumentOfPeriapsis, meanAnomaly};
}

double Orbit::getMeanAnomaly() const {
    return meanAnomaly;
}

double Orbit::getEccentricAnomaly() const {
    return eccentricAnomaly;
}

double Orbit::getTrueAnomaly() const {
    return trueAnomaly;
}

double Orbit::getSpeed() const {
    double visViva = std::sqrt(planet->getMu() * (2.0 / getRadius() - 1.0 / semiMajorAxis));
    return std::max(0.0, visViva - dragSpeedLoss);
}

double Orbit::getMeanMotion() const {
    return std::sqrt(planet->getMu() / (semiMajorAxis * semiMajorAxis * semiMajorAxis));
}

double Orbit::getPeriod() const {
    return TWO_PI / getMeanMotion();
}

double Orbit::getPeriapsisRadius() const {
    return semiMajorAxis * (1.0 - eccentricity);
}

double Orbit::getApoapsisRadius() const {
    return semiMajorAxis * (1.0 + eccentricity);
}

double Orbit::getRadius() const {
    return semiMajorAxis * (1.0 - eccentricity * std::cos(eccentricAnomaly));
}

std::shared_ptr<Planet> Orbit::getPlanet() const {
    return planet;
}

const Constants& Orbit::getConstants() const {
    return constants;
}

PropagatorType Orbit::getPropagatorType() const {
    return propagator->type();
}

void Orbit::setSemiMajorAxis(const double a) {
    validateElements(a, eccentricity, planet->getRadius());
    semiMajorAxis = a;
}

void Orbit::setEccentricity(const double e) {
    validateElements(semiMajorAxis, e, planet->getRadius());
    eccentricity = e;
    applyMeanAnomaly(meanAnomaly);
}

void Orbit::setInclination(const double i) {
    inclination = normalizeAngle(i);
}

void Orbit::setAscendingNode(const double omega) {
    ascendingNode = normalizeAngle(omega);
}

void Orbit::setArgumentOfPeriapsis(const double omega) {
    argumentOfPeriapsis = normalizeAngle(omega);
}

void Orbit::setEpoch(const double tp) {
    epoch = tp;
}

void Orbit::setMeanAnomaly(const double m) {
    applyMeanAnomaly(m);
}

// ============================================================================
// Output
// ============================================================================

std::string Orbit::toString() const {
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    os << "a: " << semiMajorAxis << "\n";
    os << "e: " << eccentricity << "\n";
    os << "i: " << inclination << "\n";
    os << "Omega: " << ascendingNode << "\n";
    os << "omega: " << argumentOfPeriapsis << "\n";
    os << "tp: " << epoch << "\n";
    os << "M: " << meanAnomaly << "\n";
    return os.str();
}

void Orbit::printInfo(std::ostream &os) const {
    os << "  Semi-major Axis: " << semiMajorAxis << " km" << std::endl;
    os << "  Eccentricity: " << eccentricity << std::endl;
    os << "  Inclination: " << inclination * RADIANS_TO_DEGREES << " deg" << std::endl;
    os << "  Longitude of Ascending Node: " << ascendingNode * RADIANS_TO_DEGREES << " deg" << std::endl;
    os << "  Argument of Periapsis: " << argumentOfPeriapsis * RADIANS_TO_DEGREES << " deg" << std::endl;
    os << "  Epoch: " << epoch << " s" << std::endl;
    os << "  Mean Motion: " << getMeanMotion() << " rad/s" << std::endl;
    os << "  Periapsis Radius: " << getPeriapsisRadius() << " km" << std::endl;
    os << "  Apoapsis Radius: " << getApoapsisRadius() << " km" << std::endl;
    os << "  Period: " << getPeriod() << " s" << std::endl;
    os << "  True Anomaly: " << trueAnomaly * RADIANS_TO_DEGREES << " deg" << std::endl;
    os << "  Eccentric Anomaly: " << eccentricAnomaly * RADIANS_TO_DEGREES << " deg" << std::endl;
    os << "  Mean Anomaly: " << meanAnomaly * RADIANS_TO_DEGREES << " deg" << std::endl;
    os << "  Propagator: " << propagator->type() << std::endl;
    os << std::endl;
}

}
