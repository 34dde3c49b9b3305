/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satsim/orbit.hpp>

#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace satsim {
namespace {

double angleDifference(double a, double b) {
    return std::remainder(a - b, TWO_PI);
}

class OrbitTest : public ::testing::Test {
protected:
    std::shared_ptr<Planet> earth = std::make_shared<Planet>(398600.4415, 6378.137);

    Orbit makeOrbit(double a = 7000.0, double e = 0.001, double i = 0.9006,
                    double node = 0.0, double periapsis = 0.0, double tp = 0.0) {
        return Orbit(earth, a, e, i, node, periapsis, tp);
    }
};

// Construction

TEST_F(OrbitTest, ConcreteScenario) {
    Orbit orbit = makeOrbit();
    double n = std::sqrt(398600.4415 / std::pow(7000.0, 3));
    EXPECT_NEAR(orbit.getMeanMotion(), 1.0780e-3, 1e-7);
    EXPECT_DOUBLE_EQ(orbit.getMeanAnomaly(), 0.0);

    orbit.updatePosition(60.0);
    EXPECT_NEAR(orbit.getMeanAnomaly(), 0.06468, 1e-5);
    EXPECT_NEAR(orbit.getMeanAnomaly(), n * 60.0, 1e-12);
}

TEST_F(OrbitTest, NormalizesAngles) {
    Orbit orbit = makeOrbit(7000.0, 0.001, -0.5, TWO_PI + 1.0, -1.0);
    EXPECT_NEAR(orbit.getInclination(), TWO_PI - 0.5, 1e-12);
    EXPECT_NEAR(orbit.getAscendingNode(), 1.0, 1e-12);
    EXPECT_NEAR(orbit.getArgumentOfPeriapsis(), TWO_PI - 1.0, 1e-12);
}

TEST_F(OrbitTest, RejectsInvalidElements) {
    EXPECT_THROW(makeOrbit(7000.0, 1.0), InvalidOrbitElements);
    EXPECT_THROW(makeOrbit(7000.0, -0.01), InvalidOrbitElements);
    EXPECT_THROW(makeOrbit(-7000.0, 0.0), InvalidOrbitElements);
    EXPECT_THROW(makeOrbit(6000.0, 0.0), InvalidOrbitElements);
    // a(1 - e) = 7000 * 0.1 = 700 km, well inside the planet
    EXPECT_THROW(makeOrbit(7000.0, 0.9), InvalidOrbitElements);
}

TEST_F(OrbitTest, RejectsMissingPlanet) {
    EXPECT_THROW(Orbit(nullptr, 7000.0, 0.0, 0.0), std::invalid_argument);
}

TEST_F(OrbitTest, DerivedQuantities) {
    Orbit orbit = makeOrbit(8000.0, 0.1);
    EXPECT_NEAR(orbit.getPeriapsisRadius(), 7200.0, 1e-9);
    EXPECT_NEAR(orbit.getApoapsisRadius(), 8800.0, 1e-9);
    EXPECT_NEAR(orbit.getPeriod(), TWO_PI / orbit.getMeanMotion(), 1e-9);
}

// Reset

TEST_F(OrbitTest, ResetIdentity) {
    Orbit orbit = makeOrbit(7000.0, 0.001, 0.9006, 0.0, 0.0, 1000.0);
    double n = std::sqrt(earth->getMu() / std::pow(7000.0, 3));
    EXPECT_DOUBLE_EQ(orbit.getMeanAnomaly(), normalizeAngle(-n * 1000.0));

    orbit.updatePosition(123.0);
    orbit.reset();
    EXPECT_DOUBLE_EQ(orbit.getMeanAnomaly(), normalizeAngle(-n * 1000.0));
}

TEST_F(OrbitTest, SetMeanAnomalyBypassesReset) {
    Orbit orbit = makeOrbit(7000.0, 0.1, 0.9006, 0.0, 0.0, 500.0);
    orbit.setMeanAnomaly(1.2345);
    EXPECT_DOUBLE_EQ(orbit.getMeanAnomaly(), 1.2345);
    EXPECT_NEAR(orbit.getEccentricAnomaly() - 0.1 * std::sin(orbit.getEccentricAnomaly()), 1.2345, 1e-6);
}

// Anomaly propagation

TEST_F(OrbitTest, AnomaliesStayConsistent) {
    Orbit orbit = makeOrbit(9000.0, 0.2);
    for (int step = 0; step < 50; step++) {
        orbit.updatePosition(97.0);
        double e = orbit.getEccentricity();
        double ea = orbit.getEccentricAnomaly();
        EXPECT_LE(std::fabs(angleDifference(ea - e * std::sin(ea), orbit.getMeanAnomaly())), 1e-6);
        EXPECT_NEAR(orbit.getTrueAnomaly(), trueAnomalyFromEccentric(ea, e), 1e-12);
    }
}

TEST_F(OrbitTest, StepDecompositionInvariance) {
    Orbit split = makeOrbit();
    Orbit whole = makeOrbit();

    split.updatePosition(1234.5);
    split.updatePosition(2345.25);
    whole.updatePosition(1234.5 + 2345.25);

    EXPECT_NEAR(angleDifference(split.getMeanAnomaly(), whole.getMeanAnomaly()), 0.0, 1e-9);
}

TEST_F(OrbitTest, ManySmallStepsMatchOneLargeStep) {
    Orbit split = makeOrbit(7000.0, 0.05);
    Orbit whole = makeOrbit(7000.0, 0.05);

    for (int step = 0; step < 600; step++) {
        split.updatePosition(10.0);
    }
    whole.updatePosition(6000.0);

    EXPECT_NEAR(angleDifference(split.getMeanAnomaly(), whole.getMeanAnomaly()), 0.0, 1e-9);
}

TEST_F(OrbitTest, MeanAnomalyWrapsAfterOnePeriod) {
    Orbit orbit = makeOrbit();
    orbit.updatePosition(orbit.getPeriod());
    EXPECT_NEAR(angleDifference(orbit.getMeanAnomaly(), 0.0), 0.0, 1e-9);
    EXPECT_LT(orbit.getMeanAnomaly(), TWO_PI);
}

// Positions

TEST_F(OrbitTest, CircularOrbitRadius) {
    Orbit orbit = makeOrbit(7000.0, 0.0);
    for (double m : {0.0, 0.7, 2.0, PI, 5.1}) {
        EXPECT_DOUBLE_EQ(orbit.getPointAt(m).getRadius(), 7000.0);
    }
}

TEST_F(OrbitTest, PeriapsisAndApoapsisPoints) {
    Orbit orbit = makeOrbit(8000.0, 0.1);
    EXPECT_NEAR(orbit.getPointAt(0.0).getRadius(), 7200.0, 1e-2);
    EXPECT_NEAR(orbit.getPointAt(PI).getRadius(), 8800.0, 1e-2);
}

TEST_F(OrbitTest, GetPointAtDoesNotMutate) {
    Orbit orbit = makeOrbit();
    orbit.updatePosition(300.0);
    double m = orbit.getMeanAnomaly();
    orbit.getPointAt(2.0);
    EXPECT_EQ(orbit.getMeanAnomaly(), m);
}

TEST_F(OrbitTest, PositionPointMatchesPointAtCurrentAnomaly) {
    Orbit orbit = makeOrbit(7500.0, 0.02, 0.9006, 0.3, 1.1);
    orbit.updatePosition(1000.0);
    auto current = orbit.getPositionPoint();
    auto sampled = orbit.getPointAt(orbit.getMeanAnomaly());
    EXPECT_NEAR(current.getRadius(), sampled.getRadius(), 1e-9);
    EXPECT_NEAR(current.getAzimuth(), sampled.getAzimuth(), 1e-9);
}

TEST_F(OrbitTest, PositionPointAnglesAreNormalized) {
    Orbit orbit = makeOrbit();
    // Past apoapsis the body is south of the equator
    orbit.setMeanAnomaly(4.0);
    auto point = orbit.getPositionPoint();
    EXPECT_TRUE(point.isSpherical());
    EXPECT_GE(point.getAzimuth(), 0.0);
    EXPECT_LT(point.getAzimuth(), TWO_PI);
    EXPECT_GT(point.getElevation(), PI);
    EXPECT_LT(point.getElevation(), TWO_PI);
    EXPECT_LT(point.getZ(), 0.0);
}

TEST_F(OrbitTest, PositionPointMatchesStateVector) {
    Orbit orbit = makeOrbit(7500.0, 0.05, 0.9006, 0.3, 1.1);
    for (int step = 0; step < 8; step++) {
        orbit.updatePosition(700.0);
        auto point = orbit.getPositionPoint().toVec3();
        auto state = orbit.getStateVector();
        EXPECT_LT((point - state.position).magnitude(), 1e-2);
    }
}

TEST_F(OrbitTest, VelocityMatchesVisViva) {
    Orbit orbit = makeOrbit(8000.0, 0.1);
    orbit.updatePosition(1500.0);
    EXPECT_NEAR(orbit.getVelocityVector().magnitude(), orbit.getSpeed(), 1e-6);
}

// Perturbations

TEST_F(OrbitTest, J2DriftsNodeAndPeriapsis) {
    Orbit orbit = makeOrbit(7000.0, 0.001, 0.9006, 1.0, 1.0);
    double r = orbit.getRadius();
    double ratio = earth->getRadius() / r;
    double rate = 1.5 * orbit.getMeanMotion() * EARTH_J2 * ratio * ratio;

    orbit.update(60.0);

    EXPECT_NEAR(orbit.getAscendingNode(), 1.0 + rate * std::cos(0.9006) * 60.0, 1e-12);
    EXPECT_NEAR(orbit.getArgumentOfPeriapsis(),
                1.0 + rate * (2.5 * std::pow(std::sin(0.9006), 2) - 1.0) * 60.0, 1e-12);
}

TEST_F(OrbitTest, J2DriftDirectionOnEquatorialOrbit) {
    Orbit orbit = makeOrbit(7000.0, 0.001, 0.0, 1.0, 1.0);
    orbit.update(60.0);

    // cos(0) = 1 pushes the node forward, 2.5·sin²(0) − 1 = −1 pulls the periapsis back
    EXPECT_GT(orbit.getAscendingNode(), 1.0);
    EXPECT_LT(orbit.getArgumentOfPeriapsis(), 1.0);
    EXPECT_NEAR(orbit.getAscendingNode() - 1.0, 1.0 - orbit.getArgumentOfPeriapsis(), 1e-15);
}

TEST_F(OrbitTest, J2LeavesShapeAndAnomalyAlone) {
    Orbit orbit = makeOrbit(7000.0, 0.01);
    orbit.updatePosition(200.0);
    double m = orbit.getMeanAnomaly();

    orbit.update(60.0);
    EXPECT_EQ(orbit.getSemiMajorAxis(), 7000.0);
    EXPECT_EQ(orbit.getEccentricity(), 0.01);
    EXPECT_EQ(orbit.getMeanAnomaly(), m);
}

TEST_F(OrbitTest, PolarOrbitKeepsItsNode) {
    Orbit orbit = makeOrbit(7000.0, 0.001, HALF_PI, 2.0, 2.0);
    orbit.update(600.0);
    EXPECT_NEAR(orbit.getAscendingNode(), 2.0, 1e-12);
    EXPECT_GT(orbit.getArgumentOfPeriapsis(), 2.0);
}

TEST_F(OrbitTest, DragSlowsLowOrbit) {
    double a = earth->getRadius() + 100.0;
    Orbit orbit = makeOrbit(a, 0.0);
    const auto &c = orbit.getConstants();
    double before = orbit.getSpeed();

    orbit.update(60.0);

    double rho = c.seaLevelDensity * std::exp(-100.0 / c.scaleHeightInKilometers);
    double v = before * 1000.0;
    double deceleration = 0.5 * c.dragCoefficient * c.dragAreaInSquareMeters * rho * v * v / c.massInKilograms;
    EXPECT_NEAR(before - orbit.getSpeed(), deceleration * 60.0 / 1000.0, 1e-12);
    EXPECT_LT(orbit.getSpeed(), before);
}

TEST_F(OrbitTest, NoDragAboveAltitudeLimit) {
    Orbit orbit = makeOrbit(earth->getRadius() + 2000.0, 0.0);
    double before = orbit.getSpeed();
    orbit.update(60.0);
    EXPECT_DOUBLE_EQ(orbit.getSpeed(), before);
}

TEST_F(OrbitTest, ResetRestoresSpeed) {
    Orbit orbit = makeOrbit(earth->getRadius() + 100.0, 0.0);
    double initial = orbit.getSpeed();
    orbit.update(600.0);
    EXPECT_LT(orbit.getSpeed(), initial);
    orbit.reset();
    EXPECT_DOUBLE_EQ(orbit.getSpeed(), initial);
}

// Strategies

TEST_F(OrbitTest, DefaultsToClosedForm) {
    EXPECT_EQ(makeOrbit().getPropagatorType(), PropagatorType::ClosedFormKepler);
}

TEST_F(OrbitTest, NumericStrategiesFollowClosedForm) {
    for (auto type : {PropagatorType::FixedStepRK4, PropagatorType::AdaptiveRKF78}) {
        Orbit numeric(earth, 7500.0, 0.05, 0.9006, 0.3, 1.1, 0.0, type);
        Orbit exact(earth, 7500.0, 0.05, 0.9006, 0.3, 1.1, 0.0);
        EXPECT_EQ(numeric.getPropagatorType(), type);

        for (int step = 0; step < 10; step++) {
            numeric.updatePosition(60.0);
            exact.updatePosition(60.0);
        }

        EXPECT_NEAR(numeric.getSemiMajorAxis(), 7500.0, 1e-3);
        EXPECT_NEAR(numeric.getEccentricity(), 0.05, 1e-7);
        EXPECT_NEAR(angleDifference(numeric.getMeanAnomaly(), exact.getMeanAnomaly()), 0.0, 1e-6);
        EXPECT_LT((numeric.getStateVector().position - exact.getStateVector().position).magnitude(), 1e-2);
    }
}

TEST_F(OrbitTest, PropagatorFixedForLifetime) {
    Orbit orbit(earth, 7500.0, 0.05, 0.9006, 0.3, 1.1, 0.0, PropagatorType::AdaptiveRKF78);
    orbit.updatePosition(100.0);
    orbit.update(100.0);
    orbit.reset();
    EXPECT_EQ(orbit.getPropagatorType(), PropagatorType::AdaptiveRKF78);

    Orbit copy = orbit;
    copy.updatePosition(60.0);
    EXPECT_EQ(copy.getPropagatorType(), PropagatorType::AdaptiveRKF78);
}

// Setters

TEST_F(OrbitTest, SettersValidate) {
    Orbit orbit = makeOrbit(7000.0, 0.01);
    EXPECT_THROW(orbit.setEccentricity(0.5), InvalidOrbitElements);
    EXPECT_EQ(orbit.getEccentricity(), 0.01);
    EXPECT_THROW(orbit.setSemiMajorAxis(6000.0), InvalidOrbitElements);
    EXPECT_EQ(orbit.getSemiMajorAxis(), 7000.0);

    orbit.setSemiMajorAxis(8000.0);
    EXPECT_EQ(orbit.getSemiMajorAxis(), 8000.0);
    orbit.setAscendingNode(-1.0);
    EXPECT_NEAR(orbit.getAscendingNode(), TWO_PI - 1.0, 1e-12);
}

TEST_F(OrbitTest, SetEccentricityRefreshesAnomalies) {
    Orbit orbit = makeOrbit(9000.0, 0.0);
    orbit.setMeanAnomaly(1.0);
    orbit.setEccentricity(0.2);
    double ea = orbit.getEccentricAnomaly();
    EXPECT_NEAR(ea - 0.2 * std::sin(ea), 1.0, 1e-6);
    EXPECT_NEAR(orbit.getTrueAnomaly(), trueAnomalyFromEccentric(ea, 0.2), 1e-12);
}

TEST_F(OrbitTest, CopiesAreIndependent) {
    Orbit original = makeOrbit();
    Orbit copy = original;
    copy.updatePosition(500.0);
    copy.update(500.0);
    EXPECT_EQ(original.getMeanAnomaly(), 0.0);
    EXPECT_EQ(original.getAscendingNode(), 0.0);
    EXPECT_EQ(copy.getPlanet(), original.getPlanet());
}

// Output

TEST_F(OrbitTest, ToStringFieldOrder) {
    Orbit orbit = makeOrbit(7000.0, 0.001, 0.9006, 0.1, 0.2, 30.0);
    auto text = orbit.toString();
    auto a = text.find("a: ");
    auto e = text.find("\ne: ");
    auto i = text.find("\ni: ");
    auto node = text.find("\nOmega: ");
    auto periapsis = text.find("\nomega: ");
    auto tp = text.find("\ntp: ");
    auto m = text.find("\nM: ");
    ASSERT_EQ(a, 0u);
    EXPECT_LT(a, e);
    EXPECT_LT(e, i);
    EXPECT_LT(i, node);
    EXPECT_LT(node, periapsis);
    EXPECT_LT(periapsis, tp);
    EXPECT_LT(tp, m);
    EXPECT_NE(m, std::string::npos);
}

TEST_F(OrbitTest, PrintInfo) {
    std::ostringstream os;
    makeOrbit().printInfo(os);
    auto text = os.str();
    EXPECT_NE(text.find("Semi-major Axis: 7000 km"), std::string::npos);
    EXPECT_NE(text.find("Propagator: kepler"), std::string::npos);
}

}
}
