/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcore/config.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>

namespace orbitcore {
namespace {

using namespace std::chrono;

class ConfigTest : public ::testing::Test {
protected:
    Config config;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(config.getDataSource(), DataSource::Telemetry);
    EXPECT_EQ(config.getDisplayFrame(), DisplayFrame::EarthFixed);
    EXPECT_FALSE(config.getWarpEnabled());
    EXPECT_DOUBLE_EQ(config.getWarpSeconds(), 1.0);
    EXPECT_FALSE(config.getFreeRunning());
    EXPECT_FALSE(config.hasManualInstant());
    EXPECT_FALSE(config.getKeplerOverrideEnabled());
    EXPECT_EQ(config.getOrbitsBefore(), 1);
    EXPECT_EQ(config.getOrbitsAfter(), 1);
    EXPECT_EQ(config.getOrbitPoints(), 100);
    EXPECT_EQ(config.getFramesPerSecond(), 10);
    EXPECT_TRUE(config.getTargetName().empty());
}

TEST_F(ConfigTest, WarpIsClamped) {
    config.setWarpSeconds(3600.0);
    EXPECT_DOUBLE_EQ(config.getWarpSeconds(), 60.0);
    config.setWarpSeconds(-100.0);
    EXPECT_DOUBLE_EQ(config.getWarpSeconds(), -60.0);
    config.setWarpSeconds(-12.5);
    EXPECT_DOUBLE_EQ(config.getWarpSeconds(), -12.5);
}

TEST_F(ConfigTest, OrbitCountsAreClamped) {
    config.setOrbitsBefore(-1);
    config.setOrbitsAfter(25);
    EXPECT_EQ(config.getOrbitsBefore(), 0);
    EXPECT_EQ(config.getOrbitsAfter(), 10);
}

TEST_F(ConfigTest, OrbitPointsAreClamped) {
    config.setOrbitPoints(1);
    EXPECT_EQ(config.getOrbitPoints(), 10);
    config.setOrbitPoints(50000);
    EXPECT_EQ(config.getOrbitPoints(), 10000);
}

TEST_F(ConfigTest, FramesPerSecondIsClamped) {
    config.setFramesPerSecond(0);
    EXPECT_EQ(config.getFramesPerSecond(), 1);
    config.setFramesPerSecond(240);
    EXPECT_EQ(config.getFramesPerSecond(), 60);
}

// Routes the default logger into a ring buffer for the duration of a test
class ConfigLogTest : public ConfigTest {
protected:
    void SetUp() override {
        previous = spdlog::default_logger();
        sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
        sink->set_pattern("%l %v");
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("config_test", sink));
    }

    void TearDown() override {
        spdlog::set_default_logger(previous);
    }

    std::vector<std::string> messages() {
        return sink->last_formatted();
    }

    std::shared_ptr<spdlog::logger> previous;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
};

TEST_F(ConfigLogTest, ClampingLogsAWarning) {
    config.setFramesPerSecond(240);
    auto logged = messages();
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_NE(logged[0].find("warning"), std::string::npos);
    EXPECT_NE(logged[0].find("Frames per second 240"), std::string::npos);
    EXPECT_NE(logged[0].find("using 60"), std::string::npos);
}

TEST_F(ConfigLogTest, InRangeValuesAreSilent) {
    config.setWarpSeconds(-12.5);
    config.setOrbitPoints(500);
    config.setOrbitsBefore(3);
    EXPECT_TRUE(messages().empty());
}

TEST_F(ConfigTest, ManualInstant) {
    EXPECT_THROW(config.getManualInstant(), std::logic_error);
    time_point instant = sys_days{year{2021}/December/5} + hours{18};
    config.setManualInstant(instant);
    EXPECT_TRUE(config.hasManualInstant());
    EXPECT_EQ(config.getManualInstant(), instant);
}

TEST(KeplerOverrideTest, ConvertsKilometersToMeters) {
    KeplerOverride override{
        .semiMajorAxisInKilometers = 7000.0,
        .eccentricity = 0.01,
        .inclination = 98.0,
        .rightAscensionOfNode = 10.0,
        .argumentOfPeriapsis = 20.0,
        .meanAnomaly = 30.0
    };
    time_point epoch = sys_days{year{2023}/November/1};

    auto elements = override.toElements(epoch);
    EXPECT_DOUBLE_EQ(elements.semiMajorAxis, 7000000.0);
    EXPECT_DOUBLE_EQ(elements.eccentricity, 0.01);
    EXPECT_DOUBLE_EQ(elements.inclination, 98.0);
    EXPECT_DOUBLE_EQ(elements.rightAscensionOfNode, 10.0);
    EXPECT_DOUBLE_EQ(elements.argumentOfPeriapsis, 20.0);
    EXPECT_DOUBLE_EQ(elements.meanAnomaly, 30.0);
    EXPECT_DOUBLE_EQ(elements.mu, EARTH_MU);
    EXPECT_EQ(elements.epoch, epoch);
}

}
}
