/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_CONFIG_HPP
#define __SATSIM_CONFIG_HPP

#include <satsim/constants.hpp>
#include <satsim/propagator.hpp>

#include <optional>
#include <string>
#include <vector>

namespace satsim {

constexpr double DEFAULT_TIME_STEP = 1.0;
constexpr double DEFAULT_DURATION = 5400.0;
constexpr double DEFAULT_SPEED = 1.0;
constexpr double DEFAULT_OUTPUT_INTERVAL = 60.0;
constexpr int DEFAULT_TRAJECTORY_POINTS = 36;

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    double getTimeStep() const;
    void setTimeStep(const double dt);

    double getDuration() const;
    void setDuration(const double seconds);

    double getSpeed() const;
    void setSpeed(const double s);

    double getOutputInterval() const;
    void setOutputInterval(const double seconds);

    double getPlanetMu() const;
    void setPlanetMu(const double mu);

    double getPlanetRadius() const;
    void setPlanetRadius(const double r);

    double getPlanetDay() const;
    void setPlanetDay(const double d);

    void addSatellite(const std::string &spec);
    void clearSatellites();
    std::vector<std::string> getSatellites() const;
    bool hasSatellites() const;

    PropagatorType getPropagator() const;
    void setPropagator(const PropagatorType type);

    int getTrajectoryPoints() const;
    void setTrajectoryPoints(const int points);

    bool hasExportLog() const;
    std::string getExportLog() const;
    void setExportLog(const std::string &path);

    bool getRealtime() const;
    void setRealtime(bool);

    bool getVerbose() const;
    void setVerbose(bool);

private:
    double timeStep = DEFAULT_TIME_STEP;
    double duration = DEFAULT_DURATION;
    double speed = DEFAULT_SPEED;
    double outputInterval = DEFAULT_OUTPUT_INTERVAL;
    double planetMu = EARTH_MU;
    double planetRadius = EARTH_RADIUS_KM;
    double planetDay = EARTH_SIDEREAL_DAY;
    std::vector<std::string> satellites;
    PropagatorType propagator = PropagatorType::ClosedFormKepler;
    int trajectoryPoints = DEFAULT_TRAJECTORY_POINTS;
    std::optional<std::string> exportLog;
    bool realtime = false;
    bool verbose = false;
};

}

#endif
