/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/config.hpp>

#include <cmath>

namespace satsim {

namespace {

constexpr int MIN_TRAJECTORY_POINTS = 2;
constexpr int MAX_TRAJECTORY_POINTS = 100000;

// Values below the range (and NaN) take the lower bound
double clampToRange(const double value, const double low, const double high) {
    if (value >= low && value <= high) {
        return value;
    }
    if (value > high) {
        return high;
    }
    return low;
}

}

double Config::getTimeStep() const {
    return timeStep;
}

void Config::setTimeStep(const double dt) {
    timeStep = clampToRange(dt, MIN_TIME_STEP, MAX_TIME_STEP);
}

double Config::getDuration() const {
    return duration;
}

void Config::setDuration(const double seconds) {
    duration = (seconds > 0.0 && std::isfinite(seconds)) ? seconds : DEFAULT_DURATION;
}

double Config::getSpeed() const {
    return speed;
}

void Config::setSpeed(const double s) {
    speed = (s > 0.0 && std::isfinite(s)) ? s : DEFAULT_SPEED;
}

double Config::getOutputInterval() const {
    return outputInterval;
}

void Config::setOutputInterval(const double seconds) {
    outputInterval = (seconds > 0.0 && std::isfinite(seconds)) ? seconds : DEFAULT_OUTPUT_INTERVAL;
}

double Config::getPlanetMu() const {
    return planetMu;
}

void Config::setPlanetMu(const double mu) {
    planetMu = clampToRange(mu, MIN_PLANET_MU, MAX_PLANET_MU);
}

double Config::getPlanetRadius() const {
    return planetRadius;
}

void Config::setPlanetRadius(const double r) {
    planetRadius = clampToRange(r, MIN_PLANET_RADIUS, MAX_PLANET_RADIUS);
}

double Config::getPlanetDay() const {
    return planetDay;
}

void Config::setPlanetDay(const double d) {
    planetDay = clampToRange(d, MIN_PLANET_DAY, MAX_PLANET_DAY);
}

void Config::addSatellite(const std::string &spec) {
    satellites.push_back(spec);
}

void Config::clearSatellites() {
    satellites.clear();
}

std::vector<std::string> Config::getSatellites() const {
    return satellites;
}

bool Config::hasSatellites() const {
    return !satellites.empty();
}

PropagatorType Config::getPropagator() const {
    return propagator;
}

void Config::setPropagator(const PropagatorType type) {
    propagator = type;
}

int Config::getTrajectoryPoints() const {
    return trajectoryPoints;
}

void Config::setTrajectoryPoints(const int points) {
    if (points >= MIN_TRAJECTORY_POINTS && points <= MAX_TRAJECTORY_POINTS) {
        trajectoryPoints = points;
    } else if (points > MAX_TRAJECTORY_POINTS) {
        trajectoryPoints = MAX_TRAJECTORY_POINTS;
    } else {
        trajectoryPoints = MIN_TRAJECTORY_POINTS;
    }
}

bool Config::hasExportLog() const {
    return exportLog.has_value();
}

std::string Config::getExportLog() const {
    return exportLog.value_or("");
}

void Config::setExportLog(const std::string &path) {
    exportLog = path;
}

bool Config::getRealtime() const {
    return realtime;
}

void Config::setRealtime(bool r) {
    realtime = r;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

}
