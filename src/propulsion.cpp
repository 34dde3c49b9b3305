/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/propulsion.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace satsim {

using spdlog::debug;

namespace {

double requirePositive(double value, const char *name) {
    if (!(value > 0.0)) {
        throw std::invalid_argument(fmt::format("{} must be positive: {}", name, value));
    }
    return value;
}

}

std::ostream& operator<<(std::ostream &os, const Maneuver &maneuver) {
    os << maneuver.deltaV << " m/s at t=" << maneuver.scheduledTime << " s toward ("
       << maneuver.direction.x << ", " << maneuver.direction.y << ", " << maneuver.direction.z << ")";
    return os;
}

Propulsion::Propulsion(double i, double t, double m, double g0)
    : isp(requirePositive(i, "Specific impulse")),
      thrust(requirePositive(t, "Thrust")),
      mass(requirePositive(m, "Mass")),
      standardGravity(requirePositive(g0, "Standard gravity")) {}

void Propulsion::addManeuver(double deltaV, const Vec3 &direction, double scheduledTime) {
    if (!(deltaV >= 0.0)) {
        throw std::invalid_argument(fmt::format("Maneuver delta-v must not be negative: {}", deltaV));
    }
    maneuvers.push_back({deltaV, direction, scheduledTime});
    requestedDeltaV += deltaV;
}

std::vector<Maneuver> Propulsion::executeManeuvers(double dt) {
    missionTime += dt;

    std::vector<Maneuver> due;
    std::copy_if(maneuvers.begin(), maneuvers.end(), std::back_inserter(due),
                 [this](const Maneuver &m) { return m.scheduledTime <= missionTime; });
    if (due.empty()) {
        return due;
    }

    maneuvers.erase(std::remove_if(maneuvers.begin(), maneuvers.end(),
                                   [this](const Maneuver &m) { return m.scheduledTime <= missionTime; }),
                    maneuvers.end());

    std::stable_sort(due.begin(), due.end(), [](const Maneuver &a, const Maneuver &b) {
        return a.scheduledTime < b.scheduledTime;
    });

    for (const auto &maneuver : due) {
        appliedDeltaV += maneuver.deltaV;
        debug("Executed maneuver of {:.3f} m/s scheduled at {:.1f} s (mission time {:.1f} s)",
              maneuver.deltaV, maneuver.scheduledTime, missionTime);
    }
    return due;
}

double Propulsion::calculateDeltaV() const {
    return isp * standardGravity * std::log((mass + thrust) / mass);
}

double Propulsion::getIsp() const {
    return isp;
}

double Propulsion::getThrust() const {
    return thrust;
}

double Propulsion::getMass() const {
    return mass;
}

double Propulsion::getStandardGravity() const {
    return standardGravity;
}

double Propulsion::getRequestedDeltaV() const {
    return requestedDeltaV;
}

double Propulsion::getAppliedDeltaV() const {
    return appliedDeltaV;
}

double Propulsion::getMissionTime() const {
    return missionTime;
}

const std::vector<Maneuver>& Propulsion::getPendingManeuvers() const {
    return maneuvers;
}

void Propulsion::reset() {
    missionTime = 0.0;
    appliedDeltaV = 0.0;
}

}
