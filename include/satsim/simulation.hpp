/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_SIMULATION_HPP
#define __SATSIM_SIMULATION_HPP

#include <satsim/planet.hpp>
#include <satsim/satellite.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace satsim {

/**
 * Steps a set of satellites around one planet with a fixed time step.
 */
class Simulation {
public:
    Simulation(std::shared_ptr<Planet> planet,
               std::string name,
               double speed = 1.0,
               double dt = 1.0);
    ~Simulation() = default;

    /**
     * When playing, advances the clock by dt and updates every satellite.
     */
    void update();

    /**
     * Adds a satellite orbiting this simulation's planet.
     * @return false if the satellite orbits a different planet
     */
    bool addSatellite(const Satellite &satellite);

    /**
     * Removes the satellite at index; out-of-range indices are ignored.
     */
    void removeSatellite(std::size_t index);

    /**
     * Returns name, or name followed by the first free "[k]" suffix when a
     * satellite already uses it.
     */
    std::string makeUniqueName(const std::string &name) const;

    Satellite& getSatellite(std::size_t index);
    const Satellite& getSatellite(std::size_t index) const;
    const std::vector<Satellite>& getSatellites() const;
    std::size_t getSatelliteCount() const;

    /**
     * Rewinds the clock and returns every satellite to its epoch.
     */
    void reset();

    /**
     * Rewinds the clock and removes all satellites.
     */
    void resetAll();

    double getTime() const;
    void setTime(const double t);

    double getTimeStep() const;
    void setTimeStep(const double dt);

    double getSpeed() const;
    void setSpeed(const double speed);

    std::string getName() const;
    void setName(const std::string &name);

    bool isPlaying() const;
    void setPlaying(bool play);
    void togglePlay();

    bool getVerbose() const;
    void setVerbose(bool verbose);

    std::shared_ptr<Planet> getPlanet() const;

    /**
     * Name, t, dt, Speed and n lines.
     */
    std::string toString() const;

private:
    std::shared_ptr<Planet> planet;
    std::string name;
    std::vector<Satellite> satellites;
    double time = 0.0;
    double timeStep;
    double speed;
    bool playing = true;
    bool verbose = false;
};

}

#endif
