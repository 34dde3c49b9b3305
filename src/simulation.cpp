/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/simulation.hpp>

#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace satsim {

using spdlog::debug;

Simulation::Simulation(std::shared_ptr<Planet> p, std::string n, double s, double dt)
    : planet(std::move(p)), name(std::move(n)), timeStep(dt), speed(s) {
    if (!planet) {
        throw std::invalid_argument("Simulation requires a planet");
    }
}

void Simulation::update() {
    if (!playing) {
        return;
    }

    time += timeStep;

    if (verbose) {
        debug("t = {}", time);
        for (const auto &satellite : satellites) {
            const auto &orbit = satellite.getOrbit();
            debug("{}: v = {} / E = {} / M = {} / {}",
                  satellite.getName(),
                  orbit.getTrueAnomaly(),
                  orbit.getEccentricAnomaly(),
                  orbit.getMeanAnomaly(),
                  fmt::streamed(satellite.getCurrentPosition()));
        }
    }

    for (auto &satellite : satellites) {
        satellite.update(timeStep);
    }
}

bool Simulation::addSatellite(const Satellite &satellite) {
    if (satellite.getPlanet() != planet) {
        debug("Rejected satellite {}: it orbits a different planet", satellite.getName());
        return false;
    }
    satellites.push_back(satellite);
    return true;
}

void Simulation::removeSatellite(std::size_t index) {
    if (index < satellites.size()) {
        satellites.erase(satellites.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

std::string Simulation::makeUniqueName(const std::string &candidate) const {
    auto taken = [this](const std::string &n) {
        return std::any_of(satellites.begin(), satellites.end(),
                           [&n](const Satellite &s) { return s.getName() == n; });
    };

    if (!taken(candidate)) {
        return candidate;
    }
    for (std::size_t k = 1;; ++k) {
        std::string next = candidate + "[" + std::to_string(k) + "]";
        if (!taken(next)) {
            return next;
        }
    }
}

Satellite& Simulation::getSatellite(std::size_t index) {
    return satellites.at(index);
}

const Satellite& Simulation::getSatellite(std::size_t index) const {
    return satellites.at(index);
}

const std::vector<Satellite>& Simulation::getSatellites() const {
    return satellites;
}

std::size_t Simulation::getSatelliteCount() const {
    return satellites.size();
}

void Simulation::reset() {
    time = 0.0;
    for (auto &satellite : satellites) {
        satellite.reset();
    }
}

void Simulation::resetAll() {
    time = 0.0;
    satellites.clear();
}

double Simulation::getTime() const {
    return time;
}

void Simulation::setTime(const double t) {
    time = t;
}

double Simulation::getTimeStep() const {
    return timeStep;
}

void Simulation::setTimeStep(const double dt) {
    timeStep = dt;
}

double Simulation::getSpeed() const {
    return speed;
}

void Simulation::setSpeed(const double s) {
    speed = s;
}

std::string Simulation::getName() const {
    return name;
}

void Simulation::setName(const std::string &n) {
    name = n;
}

bool Simulation::isPlaying() const {
    return playing;
}

void Simulation::setPlaying(bool play) {
    playing = play;
}

void Simulation::togglePlay() {
    playing = !playing;
}

bool Simulation::getVerbose() const {
    return verbose;
}

void Simulation::setVerbose(bool v) {
    verbose = v;
}

std::shared_ptr<Planet> Simulation::getPlanet() const {
    return planet;
}

std::string Simulation::toString() const {
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    os << "Name: " << name << "\n";
    os << "t: " << time << "\n";
    os << "dt: " << timeStep << "\n";
    os << "Speed: " << speed << "\n";
    os << "n: " << satellites.size() << "\n";
    return os.str();
}

}
