/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satsim/steplog.hpp>
#include <rapidjson/document.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <string>

namespace satsim {
namespace {

class StepLogTest : public ::testing::Test {
protected:
    std::shared_ptr<Planet> earth = std::make_shared<Planet>();
    Simulation simulation{earth, "LogTest", 1.0, 30.0};
    StepLog log;

    void SetUp() override {
        Orbit orbit(earth, 7000.0, 0.0, 0.0);
        simulation.addSatellite(Satellite(orbit, earth, std::nullopt, "Eq"));
    }
};

TEST_F(StepLogTest, FormatTimestamp) {
    using namespace std::chrono;
    auto tp = system_clock::time_point(seconds(1700000000)) + milliseconds(750);
    EXPECT_EQ(formatTimestampUTC(tp), "2023-11-14 22:13:20 UTC");
}

TEST_F(StepLogTest, RecordSnapshotsSatellites) {
    log.record(simulation);
    simulation.update();
    log.record(simulation);

    ASSERT_EQ(log.size(), 2u);
    const auto &first = log.getRecords()[0];
    EXPECT_EQ(first.time, 0.0);
    ASSERT_EQ(first.satellites.size(), 1u);
    EXPECT_EQ(first.satellites[0].name, "Eq");
    EXPECT_NEAR(first.satellites[0].x, 7000.0, 1e-2);
    EXPECT_NEAR(first.satellites[0].z, 0.0, 1e-9);
    EXPECT_EQ(log.getRecords()[1].time, 30.0);

    log.clear();
    EXPECT_TRUE(log.empty());
}

TEST_F(StepLogTest, JsonDocument) {
    log.record(simulation);
    simulation.update();
    log.record(simulation);

    auto json = log.toJson(simulation, "2025-01-01 00:00:00 UTC");

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());

    EXPECT_STREQ(doc["program"].GetString(), "satsim");
    EXPECT_STREQ(doc["date"].GetString(), "2025-01-01 00:00:00 UTC");
    EXPECT_STREQ(doc["simulation"]["name"].GetString(), "LogTest");
    EXPECT_EQ(doc["simulation"]["dt"].GetDouble(), 30.0);
    EXPECT_STREQ(doc["planet"]["name"].GetString(), "Earth");
    EXPECT_EQ(doc["planet"]["mu"].GetDouble(), EARTH_MU);

    const auto &steps = doc["steps"];
    ASSERT_TRUE(steps.IsArray());
    ASSERT_EQ(steps.Size(), 2u);
    EXPECT_EQ(steps[1]["t"].GetDouble(), 30.0);

    const auto &sat = steps[1]["satellites"][0];
    EXPECT_STREQ(sat["name"].GetString(), "Eq");
    EXPECT_GT(sat["M"].GetDouble(), 0.0);
    EXPECT_NEAR(sat["speed"].GetDouble(), std::sqrt(EARTH_MU / 7000.0), 1e-9);
}

}
}
