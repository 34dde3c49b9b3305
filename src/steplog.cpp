/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satsim/steplog.hpp>

#include <fstream>
#include <stdexcept>
#include <utility>

#include <date/date.h>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <spdlog/spdlog.h>

namespace satsim {

using spdlog::info;

std::string formatTimestampUTC(const time_point &tp) {
    auto truncated = std::chrono::floor<std::chrono::seconds>(tp);
    return date::format("%F %T UTC", truncated);
}

void StepLog::record(const Simulation &simulation) {
    StepRecord step{simulation.getTime(), {}};
    step.satellites.reserve(simulation.getSatelliteCount());

    for (const auto &satellite : simulation.getSatellites()) {
        const auto &orbit = satellite.getOrbit();
        Cartesian position = satellite.getCurrentPosition().asCartesian();
        step.satellites.push_back({
            satellite.getName(),
            position.x,
            position.y,
            position.z,
            orbit.getMeanAnomaly(),
            orbit.getTrueAnomaly(),
            orbit.getSpeed()
        });
    }

    records.push_back(std::move(step));
}

const std::vector<StepRecord>& StepLog::getRecords() const {
    return records;
}

std::size_t StepLog::size() const {
    return records.size();
}

bool StepLog::empty() const {
    return records.empty();
}

void StepLog::clear() {
    records.clear();
}

std::string StepLog::toJson(const Simulation &simulation, const std::string &timestamp) const {
    using rapidjson::Value;

    rapidjson::Document doc;
    doc.SetObject();
    auto &allocator = doc.GetAllocator();

    doc.AddMember("program", "satsim", allocator);
    doc.AddMember("date", Value(timestamp.c_str(), allocator), allocator);

    Value sim(rapidjson::kObjectType);
    sim.AddMember("name", Value(simulation.getName().c_str(), allocator), allocator);
    sim.AddMember("dt", simulation.getTimeStep(), allocator);
    sim.AddMember("speed", simulation.getSpeed(), allocator);
    doc.AddMember("simulation", sim, allocator);

    const auto &planet = *simulation.getPlanet();
    Value body(rapidjson::kObjectType);
    body.AddMember("name", Value(planet.getName().c_str(), allocator), allocator);
    body.AddMember("mu", planet.getMu(), allocator);
    body.AddMember("radius", planet.getRadius(), allocator);
    body.AddMember("day", planet.getDay(), allocator);
    doc.AddMember("planet", body, allocator);

    Value steps(rapidjson::kArrayType);
    for (const auto &record : records) {
        Value step(rapidjson::kObjectType);
        step.AddMember("t", record.time, allocator);

        Value satellites(rapidjson::kArrayType);
        for (const auto &sample : record.satellites) {
            Value sat(rapidjson::kObjectType);
            sat.AddMember("name", Value(sample.name.c_str(), allocator), allocator);
            sat.AddMember("x", sample.x, allocator);
            sat.AddMember("y", sample.y, allocator);
            sat.AddMember("z", sample.z, allocator);
            sat.AddMember("M", sample.meanAnomaly, allocator);
            sat.AddMember("v", sample.trueAnomaly, allocator);
            sat.AddMember("speed", sample.speed, allocator);
            satellites.PushBack(sat, allocator);
        }
        step.AddMember("satellites", satellites, allocator);
        steps.PushBack(step, allocator);
    }
    doc.AddMember("steps", steps, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

void StepLog::write(const std::string &path, const Simulation &simulation) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Couldn't open log file for writing: " + path);
    }

    out << toJson(simulation, formatTimestampUTC(std::chrono::system_clock::now())) << std::endl;
    if (!out) {
        throw std::runtime_error("Couldn't write log file: " + path);
    }
    info("Wrote {} steps to {}", records.size(), path);
}

}
