/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/satellite.hpp>
#include <satsim/constants.hpp>

#include <charconv>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace satsim {

using spdlog::debug;

// Helper function to convert substring to numeric type
template <typename T>
inline T toNumber(const std::string_view &str) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument("Couldn't convert value: " + std::string(str));
    }
    return value;
}

SatelliteSpec parseSatelliteSpec(const std::string_view &specStr) {
    std::vector<std::string_view> parts;
    for (auto &&rng : specStr | std::views::split(':')) {
        parts.emplace_back(rng.begin(), rng.end());
    }

    if (parts.size() != 6 && parts.size() != 7) {
        throw std::invalid_argument("Invalid satellite specification: " + std::string(specStr));
    }
    if (parts[0].empty()) {
        throw std::invalid_argument("Satellite name is empty: " + std::string(specStr));
    }

    SatelliteSpec spec;
    spec.name = std::string(parts[0]);
    spec.semiMajorAxis = toNumber<double>(parts[1]);
    spec.eccentricity = toNumber<double>(parts[2]);
    spec.inclination = toNumber<double>(parts[3]) * DEGREES_TO_RADIANS;
    spec.ascendingNode = toNumber<double>(parts[4]) * DEGREES_TO_RADIANS;
    spec.argumentOfPeriapsis = toNumber<double>(parts[5]) * DEGREES_TO_RADIANS;
    spec.epoch = parts.size() == 7 ? toNumber<double>(parts[6]) : 0.0;
    return spec;
}

Satellite::Satellite(const Orbit &prototype,
                     std::shared_ptr<Planet> p,
                     std::optional<Propulsion> prop,
                     std::string n)
    : orbit(p,
            prototype.getSemiMajorAxis(),
            prototype.getEccentricity(),
            prototype.getInclination(),
            prototype.getAscendingNode(),
            prototype.getArgumentOfPeriapsis(),
            prototype.getEpoch(),
            prototype.getPropagatorType(),
            prototype.getConstants()),
      planet(std::move(p)),
      propulsion(std::move(prop)),
      name(std::move(n)) {}

Satellite Satellite::fromSpec(const SatelliteSpec &spec,
                              std::shared_ptr<Planet> planet,
                              PropagatorType propagatorType,
                              const Constants &constants) {
    Orbit prototype(planet,
                    spec.semiMajorAxis,
                    spec.eccentricity,
                    spec.inclination,
                    spec.ascendingNode,
                    spec.argumentOfPeriapsis,
                    spec.epoch,
                    propagatorType,
                    constants);
    Propulsion propulsion(300.0, 1000.0, 1000.0, constants.standardGravity);
    return Satellite(prototype, planet, std::move(propulsion), spec.name);
}

void Satellite::update(double dt) {
    orbit.update(dt);
    orbit.updatePosition(dt);

    if (propulsion) {
        for (const auto &maneuver : propulsion->executeManeuvers(dt)) {
            debug("{}: {}", name, fmt::streamed(maneuver));
        }
    }
}

void Satellite::reset() {
    orbit.reset();
    if (propulsion) {
        propulsion->reset();
    }
}

Point Satellite::getCurrentPosition() const {
    return orbit.getPositionPoint();
}

Orbit& Satellite::getOrbit() {
    return orbit;
}

const Orbit& Satellite::getOrbit() const {
    return orbit;
}

std::shared_ptr<Planet> Satellite::getPlanet() const {
    return planet;
}

Propulsion* Satellite::getPropulsion() {
    return propulsion ? &*propulsion : nullptr;
}

const Propulsion* Satellite::getPropulsion() const {
    return propulsion ? &*propulsion : nullptr;
}

std::string Satellite::getName() const {
    return name;
}

void Satellite::setName(const std::string &n) {
    name = n;
}

double Satellite::getRx() const {
    return rx;
}

void Satellite::setRx(const double r) {
    rx = r;
}

double Satellite::getRy() const {
    return ry;
}

void Satellite::setRy(const double r) {
    ry = r;
}

double Satellite::getRz() const {
    return rz;
}

void Satellite::setRz(const double r) {
    rz = r;
}

std::string Satellite::toString() const {
    std::ostringstream os;
    os << "----------\n";
    os << "Name: " << name << "\n";
    os << orbit.toString();
    return os.str();
}

void Satellite::printInfo(std::ostream &os) const {
    os << "Satellite: " << name << std::endl;
    orbit.printInfo(os);
    if (propulsion) {
        os << "  Delta-v Capacity: " << propulsion->calculateDeltaV() << " m/s" << std::endl;
        os << "  Pending Maneuvers: " << propulsion->getPendingManeuvers().size() << std::endl;
        os << std::endl;
    }
}

}
