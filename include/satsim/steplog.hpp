/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SATSIM_STEPLOG_HPP
#define __SATSIM_STEPLOG_HPP

#include <satsim/simulation.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace satsim {

using time_point = std::chrono::system_clock::time_point;

/**
 * One satellite's state at a logged step.
 */
struct SatelliteSample {
    std::string name;
    double x;                   ///< km
    double y;                   ///< km
    double z;                   ///< km
    double meanAnomaly;         ///< rad
    double trueAnomaly;         ///< rad
    double speed;               ///< km/s
};

/**
 * All satellites at one simulation time.
 */
struct StepRecord {
    double time;                ///< Simulation time (s)
    std::vector<SatelliteSample> satellites;
};

/**
 * Formats a time point as "YYYY-MM-DD HH:MM:SS UTC".
 */
std::string formatTimestampUTC(const time_point &tp);

/**
 * Accumulates snapshots of a running simulation and exports them as JSON.
 *
 * Document layout:
 *   {
 *     "program": "satsim",
 *     "date": "2025-01-01 00:00:00 UTC",
 *     "simulation": {"name": ..., "dt": ..., "speed": ...},
 *     "planet": {"name": ..., "mu": ..., "radius": ..., "day": ...},
 *     "steps": [{"t": ..., "satellites": [{"name", "x", "y", "z", "M", "v", "speed"}]}]
 *   }
 */
class StepLog {
public:
    StepLog() = default;
    ~StepLog() = default;

    /**
     * Snapshots every satellite of the simulation at its current time.
     */
    void record(const Simulation &simulation);

    const std::vector<StepRecord>& getRecords() const;
    std::size_t size() const;
    bool empty() const;
    void clear();

    /**
     * Serializes the log with the given timestamp string.
     */
    std::string toJson(const Simulation &simulation, const std::string &timestamp) const;

    /**
     * Writes the log to path, stamped with the current UTC time.
     * @throws std::runtime_error if the file cannot be written
     */
    void write(const std::string &path, const Simulation &simulation) const;

private:
    std::vector<StepRecord> records;
};

}

#endif
