/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <satsim/planet.hpp>

#include <stdexcept>
#include <string>

namespace satsim {
namespace {

class PlanetTest : public ::testing::Test {
protected:
    Planet earth;
};

TEST_F(PlanetTest, DefaultsToEarth) {
    EXPECT_EQ(earth.getName(), "Earth");
    EXPECT_DOUBLE_EQ(earth.getMu(), EARTH_MU);
    EXPECT_DOUBLE_EQ(earth.getRadius(), EARTH_RADIUS_KM);
    EXPECT_DOUBLE_EQ(earth.getDay(), EARTH_SIDEREAL_DAY);
    EXPECT_FALSE(earth.getNightImgPath().has_value());
}

TEST_F(PlanetTest, GeostationaryRadius) {
    // About 42164 km for Earth
    EXPECT_NEAR(earth.getGeostationaryRadius(), 42164.0, 1.0);
}

TEST_F(PlanetTest, RejectsNonPositiveParameters) {
    EXPECT_THROW(Planet(0.0), std::invalid_argument);
    EXPECT_THROW(Planet(EARTH_MU, -1.0), std::invalid_argument);
    EXPECT_THROW(Planet(EARTH_MU, EARTH_RADIUS_KM, 0.0), std::invalid_argument);
}

TEST_F(PlanetTest, SettersValidate) {
    earth.setRadius(3389.5);
    EXPECT_DOUBLE_EQ(earth.getRadius(), 3389.5);
    EXPECT_THROW(earth.setMu(-5.0), std::invalid_argument);
    EXPECT_THROW(earth.setDay(0.0), std::invalid_argument);
    EXPECT_DOUBLE_EQ(earth.getMu(), EARTH_MU);
}

TEST_F(PlanetTest, ToStringFields) {
    Planet mars(42828.37, 3389.5, 88642.66, "Mars", "assets/mars.jpg", std::string("assets/mars_night.jpg"));
    auto text = mars.toString();
    EXPECT_NE(text.find("Name: Mars\n"), std::string::npos);
    EXPECT_NE(text.find("Radius: 3389.5\n"), std::string::npos);
    EXPECT_NE(text.find("Mu: 42828.37"), std::string::npos);
    EXPECT_NE(text.find("ImgPath: assets/mars.jpg\n"), std::string::npos);
    EXPECT_NE(text.find("NightImgPath: assets/mars_night.jpg\n"), std::string::npos);
    EXPECT_LT(text.find("Name:"), text.find("Radius:"));
    EXPECT_LT(text.find("Radius:"), text.find("Mu:"));
    EXPECT_LT(text.find("Mu:"), text.find("Day:"));
}

}
}
