/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcore/orbit_trail.hpp>
#include <orbitcore/simulation_context.hpp>

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace orbitcore {
namespace {

using namespace std::chrono;

// Epoch 2023-11-01 00:00
constexpr const char* FILE_A =
    "ISS\n"
    "1 25544U 98067A   23305.00000000  .00016717  00000+0  30308-3 0  9991\n"
    "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.50125391 42535\n"
    "NOAA 19\n"
    "1 33591U 09005A   23305.25000000  .00000054  00000+0  52635-4 0  9998\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889766317\n";

// Epoch 2023-11-02 00:00
constexpr const char* FILE_B =
    "ISS\n"
    "1 25544U 98067A   23306.00000000  .00016717  00000+0  30308-3 0  9992\n"
    "2 25544  51.6416 242.4627 0006703 131.5360 326.0288 15.50125391 42699\n"
    "NOAA 19\n"
    "1 33591U 09005A   23306.25000000  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889766317\n";

const time_point NOV_1 = sys_days{year{2023}/November/1};
const time_point NOV_2 = sys_days{year{2023}/November/2};

class SimulationContextTest : public ::testing::Test {
protected:
    time_point wall = sys_days{year{2025}/March/14} + hours{9};

    static std::vector<std::pair<std::string, std::string>> files() {
        return {{"b.tle", FILE_B}, {"a.tle", FILE_A}};
    }
};

TEST_F(SimulationContextTest, DefaultTelemetryFrame) {
    SimulationContext context;
    auto frame = context.updateFrame(wall);

    EXPECT_EQ(frame.instant, wall);
    EXPECT_EQ(context.getClock().getMode(), ClockMode::Manual);
    EXPECT_FALSE(frame.rosterChanged);
    EXPECT_TRUE(frame.fleet.empty());
    EXPECT_EQ(frame.displayFrame, DisplayFrame::EarthFixed);

    ASSERT_TRUE(frame.primary.has_value());
    EXPECT_EQ(frame.primary->osv.timestamp, defaultTelemetry().timestamp);
    EXPECT_EQ(frame.primary->propagated.timestamp, wall);
    EXPECT_GT(frame.primary->geodetic.altInMeters, 300000.0);
    EXPECT_LT(frame.primary->geodetic.altInMeters, 500000.0);
    EXPECT_NEAR(static_cast<double>(frame.orbitTrail.size()), 2.0 * MIN_TRAIL_POINTS_PER_PERIOD + 1, 1.0);
}

TEST_F(SimulationContextTest, FrameCarriesTimeQuantities) {
    SimulationContext context;
    auto frame = context.updateFrame(wall);

    auto julian = computeJulianTime(wall);
    EXPECT_DOUBLE_EQ(frame.julian.jt, julian.jt);
    EXPECT_DOUBLE_EQ(frame.nutation.dpsi, nutationTerms(julianCenturies(julian.jt)).dpsi);
    EXPECT_NEAR(frame.siderealTime,
                computeSiderealTime(0.0, julian.jd, julian.jt, frame.nutation), 1e-12);
}

TEST_F(SimulationContextTest, ConfiguredManualInstant) {
    Config config;
    time_point manual = sys_days{year{2021}/December/5} + hours{18} + minutes{10};
    config.setManualInstant(manual);
    SimulationContext context(config);
    context.start(wall);
    EXPECT_EQ(context.updateFrame(wall).instant, manual);
}

TEST_F(SimulationContextTest, LoadingFilesLocksToEarliestEpoch) {
    SimulationContext context;
    context.loadTleFiles(files(), wall);

    EXPECT_EQ(context.getClock().getMode(), ClockMode::EpochLocked);
    EXPECT_EQ(context.getClock().currentInstant(), NOV_1);
    ASSERT_NE(context.getFileSet().currentFile(), nullptr);
    EXPECT_EQ(context.getFileSet().currentFile()->filename, "a.tle");
    ASSERT_EQ(context.getRoster().size(), 2);

    auto frame = context.updateFrame(wall);
    EXPECT_EQ(frame.instant, NOV_1);
    EXPECT_FALSE(frame.rosterChanged);
    EXPECT_EQ(frame.fleet.size(), 2);
}

TEST_F(SimulationContextTest, FreeRunningKeepsWallClock) {
    Config config;
    config.setFreeRunning(true);
    SimulationContext context(config);
    context.loadTleFiles(files(), wall);

    EXPECT_EQ(context.getClock().getMode(), ClockMode::FreeRunning);
    // Later than every file, so the last one is active
    EXPECT_EQ(context.getFileSet().currentFile()->filename, "b.tle");

    auto frame = context.updateFrame(wall + seconds{1});
    EXPECT_EQ(frame.instant, wall + seconds{1});
}

TEST_F(SimulationContextTest, RosterSwitchesWhenInstantCrossesFileEpoch) {
    SimulationContext context;
    context.loadTleFiles(files(), wall);
    context.updateFrame(wall);

    context.getConfig().setManualDelta({.days = 1});
    auto frame = context.updateFrame(wall);
    EXPECT_EQ(frame.instant, NOV_2);
    EXPECT_TRUE(frame.rosterChanged);
    EXPECT_EQ(context.getFileSet().currentFile()->filename, "b.tle");
    EXPECT_EQ(context.getRoster().front().getEpoch(), NOV_2);

    EXPECT_FALSE(context.updateFrame(wall).rosterChanged);

    context.getConfig().setManualDelta({.hours = 23});
    EXPECT_TRUE(context.updateFrame(wall).rosterChanged);
    EXPECT_EQ(context.getFileSet().currentFile()->filename, "a.tle");
}

TEST_F(SimulationContextTest, WarpAdvancesEveryFrame) {
    SimulationContext context;
    context.getConfig().setWarpEnabled(true);
    context.getConfig().setWarpSeconds(60.0);
    context.loadTleFiles(files(), wall);

    time_point last;
    for (int frame = 0; frame < 3; frame++) {
        last = context.updateFrame(wall).instant;
    }
    EXPECT_EQ(last, NOV_1 + minutes{3});
}

TEST_F(SimulationContextTest, ResetReturnsToWallClock) {
    Config config;
    config.setManualInstant(sys_days{year{2021}/January/1});
    config.setWarpEnabled(true);
    config.setWarpSeconds(60.0);
    config.setManualDelta({.hours = 3});
    SimulationContext context(config);
    context.updateFrame(wall);
    context.updateFrame(wall);

    context.reset(wall);
    auto frame = context.updateFrame(wall);
    EXPECT_EQ(frame.instant, wall);
    EXPECT_EQ(context.getClock().getWarpOffset().count(), 0.0);
    EXPECT_EQ(context.getConfig().getManualDelta(), ManualDelta{});
    EXPECT_FALSE(context.getConfig().getWarpEnabled());

    // Follows the wall clock on later frames
    EXPECT_EQ(context.updateFrame(wall + seconds{2}).instant, wall + seconds{2});
}

TEST_F(SimulationContextTest, ResetKeepsEpochLockingForLaterFiles) {
    SimulationContext context;
    context.loadTleFiles(files(), wall);
    context.getConfig().setManualDelta({.days = 1});
    context.updateFrame(wall);

    context.reset(wall);
    EXPECT_EQ(context.updateFrame(wall).instant, wall);
    EXPECT_EQ(context.getFileSet().currentFile()->filename, "b.tle");

    context.loadTleFiles(files(), wall);
    EXPECT_EQ(context.getClock().getMode(), ClockMode::EpochLocked);
    EXPECT_EQ(context.updateFrame(wall).instant, NOV_1);
}

TEST_F(SimulationContextTest, TwoLineElementsSource) {
    SimulationContext context;
    context.getConfig().setDataSource(DataSource::TwoLineElements);
    context.loadTleFiles(files(), wall);

    auto frame = context.updateFrame(wall);
    ASSERT_TRUE(frame.primary.has_value());
    EXPECT_EQ(context.getDataSourceSelector().getTarget()->getName(), "ISS");
    EXPECT_EQ(frame.primary->osv.timestamp, NOV_1);
    EXPECT_DOUBLE_EQ(frame.primary->propagated.position.x, frame.primary->osv.position.x);
    EXPECT_NEAR(frame.primary->propagated.position.magnitude(), frame.fleet[0].j2000.position.magnitude(), 1.0);
}

TEST_F(SimulationContextTest, ConfiguredTargetIsSelected) {
    SimulationContext context;
    context.getConfig().setDataSource(DataSource::TwoLineElements);
    context.getConfig().setTargetName("NOAA 19");
    context.loadTleFiles(files(), wall);

    EXPECT_EQ(context.getDataSourceSelector().getTarget()->getNoradID(), 33591);
    auto frame = context.updateFrame(wall);
    ASSERT_TRUE(frame.primary.has_value());
    EXPECT_GT(frame.primary->geodetic.altInMeters, 800000.0);
}

TEST_F(SimulationContextTest, UnknownTargetFallsBackToFirst) {
    SimulationContext context;
    context.getConfig().setTargetName("HUBBLE");
    context.loadTleFiles(files(), wall);
    EXPECT_EQ(context.getDataSourceSelector().getTarget()->getName(), "ISS");
}

TEST_F(SimulationContextTest, KeplerOverrideForcesManualVector) {
    SimulationContext context;
    context.getConfig().setKeplerOverrideEnabled(true);
    context.getConfig().setKeplerOverride({.semiMajorAxisInKilometers = 7000.0, .eccentricity = 0.001});

    auto frame = context.updateFrame(wall);
    EXPECT_EQ(context.getConfig().getDataSource(), DataSource::ManualVector);
    ASSERT_TRUE(frame.primary.has_value());
    EXPECT_DOUBLE_EQ(frame.primary->kepler.semiMajorAxis, 7000000.0);
    EXPECT_EQ(frame.primary->kepler.epoch, wall);
    EXPECT_NEAR(frame.primary->propagated.position.magnitude(), 7000000.0, 7100.0);
}

TEST_F(SimulationContextTest, EmptyEphemerisTableGivesNoPrimary) {
    SimulationContext context;
    context.getConfig().setDataSource(DataSource::EphemerisTable);

    auto frame = context.updateFrame(wall);
    EXPECT_FALSE(frame.primary.has_value());
    EXPECT_FALSE(frame.primaryPosition().has_value());
    EXPECT_TRUE(frame.orbitTrail.empty());

    std::ostringstream os;
    os << frame;
    EXPECT_NE(os.str().find("no primary state"), std::string::npos);
}

TEST_F(SimulationContextTest, FrameCarriesSunAndMoon) {
    SimulationContext context;
    auto frame = context.updateFrame(wall);

    EXPECT_NEAR(frame.sun.position.magnitude() / ASTRONOMICAL_UNIT, 1.0, 0.02);
    EXPECT_GT(frame.moon.position.magnitude(), 356000.0e3);
    EXPECT_LT(frame.moon.position.magnitude(), 407000.0e3);
    EXPECT_NEAR(frame.sun.subPoint.latInDegrees, frame.sun.declination, 0.01);
    EXPECT_LE(std::abs(frame.moon.subPoint.latInDegrees), 29.0);
}

TEST_F(SimulationContextTest, PrimaryPositionFollowsDisplayFrame) {
    SimulationContext context;
    context.getConfig().setDisplayFrame(DisplayFrame::Inertial);
    auto frame = context.updateFrame(wall);
    ASSERT_TRUE(frame.primaryPosition().has_value());
    EXPECT_DOUBLE_EQ(frame.primaryPosition()->x, frame.primary->propagated.position.x);

    context.getConfig().setDisplayFrame(DisplayFrame::EarthFixed);
    frame = context.updateFrame(wall);
    EXPECT_DOUBLE_EQ(frame.primaryPosition()->x, frame.primary->ecef.position.x);
}

TEST_F(SimulationContextTest, ColorMapSurvivesRosterReload) {
    SimulationContext context;
    context.loadTleFiles(files(), wall);
    context.setColorMap("NOAA 19,255,128,0\n");
    EXPECT_EQ(context.getRoster()[1].getColor(), (Color{255, 128, 0}));

    context.getConfig().setManualDelta({.days = 1});
    auto frame = context.updateFrame(wall);
    ASSERT_TRUE(frame.rosterChanged);
    EXPECT_EQ(context.getRoster()[1].getColor(), (Color{255, 128, 0}));
    EXPECT_EQ(frame.fleet[1].color, (Color{255, 128, 0}));
}

TEST_F(SimulationContextTest, BadFileKeepsCurrentSet) {
    SimulationContext context;
    context.loadTleFiles(files(), wall);
    EXPECT_THROW(context.loadTleFiles({{"a.tle", FILE_A}, {"empty.tle", ""}}, wall), std::invalid_argument);
    EXPECT_EQ(context.getFileSet().size(), 2);
    EXPECT_EQ(context.getRoster().size(), 2);
}

TEST_F(SimulationContextTest, LoadSingleSet) {
    SimulationContext context;
    context.loadTleSet("b.tle", FILE_B, wall);
    EXPECT_EQ(context.getFileSet().size(), 1);
    EXPECT_EQ(context.getClock().currentInstant(), NOV_2);
}

}
}
