/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcore/simulation_clock.hpp>

#include <chrono>
#include <sstream>
#include <stdexcept>

namespace orbitcore {
namespace {

using namespace std::chrono;

class SimulationClockTest : public ::testing::Test {
protected:
    SimulationClock clock;
    time_point wall = sys_days{year{2025}/March/14} + hours{9};
    time_point manual = sys_days{year{2021}/December/5} + hours{18} + minutes{10};
    time_point epoch = sys_days{year{2023}/November/1};
};

TEST_F(SimulationClockTest, StartsIdle) {
    EXPECT_TRUE(clock.isIdle());
    EXPECT_EQ(clock.getMode(), ClockMode::Idle);
    EXPECT_THROW(clock.currentInstant(), std::logic_error);
}

TEST_F(SimulationClockTest, IdleClockDoesNotWarp) {
    clock.setWarpEnabled(true);
    clock.setWarpRate(60.0);
    clock.advanceFrame(wall);
    EXPECT_EQ(clock.getWarpOffset().count(), 0.0);
}

TEST_F(SimulationClockTest, FreeRunningFollowsWallClock) {
    clock.startFreeRunning(wall);
    EXPECT_EQ(clock.getMode(), ClockMode::FreeRunning);
    EXPECT_EQ(clock.currentInstant(), wall);

    clock.advanceFrame(wall + seconds{5});
    EXPECT_EQ(clock.currentInstant(), wall + seconds{5});
}

TEST_F(SimulationClockTest, ManualInstant) {
    clock.setManualInstant(manual);
    EXPECT_EQ(clock.getMode(), ClockMode::Manual);
    clock.advanceFrame(wall);
    EXPECT_EQ(clock.currentInstant(), manual);
}

TEST_F(SimulationClockTest, WarpAccumulatesPerFrame) {
    clock.setManualInstant(manual);
    clock.setWarpEnabled(true);
    clock.setWarpRate(60.0);
    for (int frame = 0; frame < 10; frame++) {
        clock.advanceFrame(wall);
    }
    EXPECT_DOUBLE_EQ(clock.getWarpOffset().count(), 600.0);
    EXPECT_EQ(clock.currentInstant(), manual + minutes{10});
}

TEST_F(SimulationClockTest, NegativeWarpRunsBackwards) {
    clock.setManualInstant(manual);
    clock.setWarpEnabled(true);
    clock.setWarpRate(-30.0);
    clock.advanceFrame(wall);
    clock.advanceFrame(wall);
    EXPECT_EQ(clock.currentInstant(), manual - minutes{1});
}

TEST_F(SimulationClockTest, DisablingWarpFreezesOffset) {
    clock.setManualInstant(manual);
    clock.setWarpEnabled(true);
    clock.setWarpRate(10.0);
    clock.advanceFrame(wall);
    clock.advanceFrame(wall);

    clock.setWarpEnabled(false);
    clock.advanceFrame(wall);
    clock.advanceFrame(wall);
    EXPECT_DOUBLE_EQ(clock.getWarpOffset().count(), 20.0);
    EXPECT_EQ(clock.currentInstant(), manual + seconds{20});
}

TEST_F(SimulationClockTest, WarpSurvivesFreeRunningReseed) {
    clock.startFreeRunning(wall);
    clock.setWarpEnabled(true);
    clock.setWarpRate(60.0);
    clock.advanceFrame(wall + seconds{1});
    clock.advanceFrame(wall + seconds{2});
    EXPECT_EQ(clock.currentInstant(), wall + seconds{2} + minutes{2});
}

TEST_F(SimulationClockTest, ManualDeltaIsAdded) {
    ManualDelta delta{.days = 1, .hours = 2, .minutes = 3, .seconds = 4.5};
    EXPECT_DOUBLE_EQ(delta.total().count(), 86400.0 + 7200.0 + 180.0 + 4.5);

    clock.setManualInstant(manual);
    clock.setManualDelta(delta);
    EXPECT_EQ(clock.currentInstant(), manual + days{1} + hours{2} + minutes{3} + milliseconds{4500});

    clock.setManualDelta({.days = -1});
    EXPECT_EQ(clock.currentInstant(), manual - days{1});
}

TEST_F(SimulationClockTest, TleSetLocksToEpoch) {
    clock.setManualInstant(manual);
    clock.onTleSetLoaded(epoch);
    EXPECT_EQ(clock.getMode(), ClockMode::EpochLocked);
    EXPECT_EQ(clock.currentInstant(), epoch);
}

TEST_F(SimulationClockTest, FreeRunningIgnoresTleEpoch) {
    clock.startFreeRunning(wall);
    clock.onTleSetLoaded(epoch);
    EXPECT_EQ(clock.getMode(), ClockMode::FreeRunning);
    EXPECT_EQ(clock.currentInstant(), wall);
    EXPECT_TRUE(clock.isFreeRunningRequested());
}

TEST_F(SimulationClockTest, StopFreeRunningReturnsToEpoch) {
    clock.startFreeRunning(wall);
    clock.onTleSetLoaded(epoch);
    clock.stopFreeRunning();
    EXPECT_FALSE(clock.isFreeRunningRequested());
    EXPECT_EQ(clock.getMode(), ClockMode::EpochLocked);
    EXPECT_EQ(clock.currentInstant(), epoch);
}

TEST_F(SimulationClockTest, StopFreeRunningReturnsToManualInstant) {
    clock.setManualInstant(manual);
    clock.startFreeRunning(wall);
    clock.stopFreeRunning();
    EXPECT_EQ(clock.getMode(), ClockMode::Manual);
    EXPECT_EQ(clock.currentInstant(), manual);
}

TEST_F(SimulationClockTest, StopFreeRunningKeepsLastSample) {
    clock.startFreeRunning(wall);
    clock.advanceFrame(wall + seconds{30});
    clock.stopFreeRunning();
    EXPECT_EQ(clock.getMode(), ClockMode::Manual);
    clock.advanceFrame(wall + hours{1});
    EXPECT_EQ(clock.currentInstant(), wall + seconds{30});
}

TEST_F(SimulationClockTest, ManualInstantReplacesLockedEpoch) {
    clock.setManualInstant(manual);
    clock.onTleSetLoaded(epoch);
    clock.setManualInstant(manual + hours{1});
    EXPECT_EQ(clock.getMode(), ClockMode::Manual);
    EXPECT_EQ(clock.currentInstant(), manual + hours{1});
}

TEST_F(SimulationClockTest, ResetClearsOffsetsAndFreeRuns) {
    clock.setManualInstant(manual);
    clock.setWarpEnabled(true);
    clock.setWarpRate(60.0);
    clock.setManualDelta({.hours = 5});
    clock.advanceFrame(wall);

    clock.reset(wall);
    EXPECT_EQ(clock.getMode(), ClockMode::FreeRunning);
    EXPECT_EQ(clock.getWarpOffset().count(), 0.0);
    EXPECT_EQ(clock.getManualDelta(), ManualDelta{});
    EXPECT_EQ(clock.currentInstant(), wall);
    EXPECT_FALSE(clock.isFreeRunningRequested());

    clock.advanceFrame(wall + seconds{5});
    EXPECT_EQ(clock.currentInstant(), wall + seconds{5});
}

TEST_F(SimulationClockTest, TleSetAfterResetStillLocks) {
    clock.onTleSetLoaded(epoch);
    clock.reset(wall);
    EXPECT_EQ(clock.currentInstant(), wall);

    clock.onTleSetLoaded(epoch + hours{24});
    EXPECT_EQ(clock.getMode(), ClockMode::EpochLocked);
    EXPECT_EQ(clock.currentInstant(), epoch + hours{24});
}

TEST_F(SimulationClockTest, ResetKeepsFreeRunningRequest) {
    clock.startFreeRunning(wall);
    clock.reset(wall + hours{1});
    EXPECT_TRUE(clock.isFreeRunningRequested());
    clock.onTleSetLoaded(epoch);
    EXPECT_EQ(clock.getMode(), ClockMode::FreeRunning);
}

TEST(ClockModeTest, Print) {
    std::ostringstream os;
    os << ClockMode::EpochLocked << " " << ClockMode::Idle;
    EXPECT_EQ(os.str(), "EpochLocked Idle");
}

}
}
