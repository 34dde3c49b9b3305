/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_PROPULSION_HPP
#define __SATSIM_PROPULSION_HPP

#include <satsim/constants.hpp>
#include <satsim/point.hpp>

#include <iostream>
#include <vector>

namespace satsim {

/**
 * An impulsive burn scheduled at an absolute mission time.
 */
struct Maneuver {
    double deltaV;           ///< Velocity change (m/s)
    Vec3 direction;          ///< Burn direction, not necessarily unit length
    double scheduledTime;    ///< Mission time of the burn (s)
};

std::ostream& operator<<(std::ostream &os, const Maneuver &maneuver);

/**
 * Queue of scheduled maneuvers and the Δv bookkeeping of one spacecraft.
 *
 * Maneuver times are measured against the cumulative mission time, which
 * advances by the dt of each executeManeuvers() call.
 */
class Propulsion {
public:
    /**
     * @param isp Specific impulse (s)
     * @param thrust Thrust (N)
     * @param mass Propellant mass (kg)
     * @param standardGravity g0 (m/s²)
     * @throws std::invalid_argument if any parameter is not positive
     */
    explicit Propulsion(double isp = 300.0,
                        double thrust = 1000.0,
                        double mass = 1000.0,
                        double standardGravity = STANDARD_GRAVITY);
    ~Propulsion() = default;

    /**
     * Queues a maneuver and adds its Δv to the requested total.
     * @throws std::invalid_argument if deltaV is negative
     */
    void addManeuver(double deltaV, const Vec3 &direction, double scheduledTime);

    /**
     * Advances the mission time by dt, then removes and returns every pending
     * maneuver whose scheduled time has been reached, in scheduled order.
     */
    std::vector<Maneuver> executeManeuvers(double dt);

    /**
     * Total Δv capacity (m/s): Isp·g0·ln((mass + thrust) / mass).
     */
    double calculateDeltaV() const;

    double getIsp() const;
    double getThrust() const;
    double getMass() const;
    double getStandardGravity() const;

    double getRequestedDeltaV() const;
    double getAppliedDeltaV() const;
    double getMissionTime() const;
    const std::vector<Maneuver>& getPendingManeuvers() const;

    /**
     * Clears the mission clock and the applied Δv. Pending maneuvers stay queued.
     */
    void reset();

private:
    double isp;
    double thrust;
    double mass;
    double standardGravity;

    double requestedDeltaV = 0.0;
    double appliedDeltaV = 0.0;
    double missionTime = 0.0;
    std::vector<Maneuver> maneuvers;
};

}

#endif
