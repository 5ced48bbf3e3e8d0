/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcore/frame_loop.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace orbitcore {
namespace {

using namespace std::chrono;

class FrameLoopTest : public ::testing::Test {
protected:
    FrameLoopTest() {
        Config config;
        config.setFramesPerSecond(60);
        config.setManualInstant(sys_days{year{2023}/November/1});
        context = std::make_unique<SimulationContext>(config);
    }

    std::unique_ptr<SimulationContext> context;
};

TEST_F(FrameLoopTest, StopsAtFrameLimit) {
    FrameLoop loop(*context);
    std::atomic<int> callbacks = 0;
    loop.setFrameLimit(3);
    loop.setFrameCallback([&callbacks](const FrameResult &frame) {
        EXPECT_TRUE(frame.primary.has_value());
        callbacks++;
    });

    EXPECT_EQ(loop.status(), FrameLoopStatus::STOPPED);
    loop.start();
    loop.wait();

    EXPECT_EQ(loop.frameCount(), 3);
    EXPECT_EQ(callbacks.load(), 3);
    EXPECT_EQ(loop.status(), FrameLoopStatus::STOPPED);
}

TEST_F(FrameLoopTest, FramesShareTheSimulatedInstant) {
    context->getConfig().setWarpEnabled(true);
    context->getConfig().setWarpSeconds(10.0);

    FrameLoop loop(*context);
    std::vector<time_point> instants;
    loop.setFrameLimit(4);
    loop.setFrameCallback([&instants](const FrameResult &frame) {
        instants.push_back(frame.instant);
    });
    loop.start();
    loop.wait();

    ASSERT_EQ(instants.size(), 4);
    for (std::size_t i = 1; i < instants.size(); i++) {
        EXPECT_EQ(instants[i] - instants[i - 1], seconds{10});
    }
}

TEST_F(FrameLoopTest, StopEndsTheLoop) {
    FrameLoop loop(*context);
    loop.start();
    EXPECT_EQ(loop.status(), FrameLoopStatus::RUNNING);

    std::this_thread::sleep_for(milliseconds{50});
    loop.stop();
    loop.wait();
    EXPECT_EQ(loop.status(), FrameLoopStatus::STOPPED);
}

TEST_F(FrameLoopTest, StartTwiceIsIgnored) {
    FrameLoop loop(*context);
    loop.setFrameLimit(2);
    loop.start();
    loop.start();
    loop.wait();
    EXPECT_EQ(loop.frameCount(), 2);
}

TEST_F(FrameLoopTest, RestartsAfterStop) {
    FrameLoop loop(*context);
    std::atomic<int> callbacks = 0;
    loop.setFrameLimit(2);
    loop.setFrameCallback([&callbacks](const FrameResult &) {
        callbacks++;
    });

    loop.start();
    loop.wait();
    ASSERT_EQ(loop.frameCount(), 2);

    loop.start();
    loop.wait();
    EXPECT_EQ(loop.frameCount(), 2);
    EXPECT_EQ(callbacks.load(), 4);
    EXPECT_EQ(loop.status(), FrameLoopStatus::STOPPED);
}

TEST_F(FrameLoopTest, RestartsAfterManualStop) {
    FrameLoop loop(*context);
    loop.start();
    std::this_thread::sleep_for(milliseconds{50});
    loop.stop();
    loop.wait();

    loop.setFrameLimit(3);
    loop.start();
    EXPECT_EQ(loop.status(), FrameLoopStatus::RUNNING);
    loop.wait();
    EXPECT_EQ(loop.frameCount(), 3);
}

TEST_F(FrameLoopTest, FailingCallbackStillCountsFrame) {
    FrameLoop loop(*context);
    loop.setFrameLimit(2);
    loop.setFrameCallback([](const FrameResult &) {
        throw std::runtime_error("display unavailable");
    });
    loop.start();
    loop.wait();
    EXPECT_EQ(loop.frameCount(), 2);
    EXPECT_EQ(loop.status(), FrameLoopStatus::STOPPED);
}

}
}
