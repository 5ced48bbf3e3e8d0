/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_FRAME_LOOP_HPP
#define __ORBITCORE_FRAME_LOOP_HPP

#include <orbitcore/simulation_context.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

#include <asio.hpp>

namespace orbitcore {

// The current status of the frame loop
enum class FrameLoopStatus {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING
};

/**
 * Drives SimulationContext::updateFrame from an asio steady timer at the
 * configured frame rate. SIGINT and SIGTERM stop the loop. The context is
 * only touched from the loop's IO thread while it runs.
 */
class FrameLoop {
public:
    using FrameCallback = std::function<void(const FrameResult &)>;

    explicit FrameLoop(SimulationContext &context) : context(context) {}
    ~FrameLoop();

    FrameLoopStatus status() const;

    /**
     * Stop after this many frames. Unlimited when empty.
     */
    void setFrameLimit(std::optional<std::size_t> limit);

    /**
     * Called on the IO thread with every computed frame.
     */
    void setFrameCallback(FrameCallback callback);

    /**
     * Frames computed since the last start().
     */
    std::size_t frameCount() const;

    /**
     * Starts the IO thread. Ignored unless the loop is stopped; a stopped
     * loop can be started again.
     */
    void start();
    void stop();
    void wait();

private:
    SimulationContext &context;
    std::atomic<FrameLoopStatus> _status = FrameLoopStatus::STOPPED;
    std::atomic<std::size_t> frames = 0;
    std::optional<std::size_t> frameLimit;
    FrameCallback onFrame;
    std::thread ioThread;
    asio::io_context io;
    asio::signal_set signals{io, SIGINT, SIGTERM};
    std::unique_ptr<asio::steady_timer> frameTimer;

    void initSignals();
    void scheduleFrame();
    void runFrame();
};

}

#endif
