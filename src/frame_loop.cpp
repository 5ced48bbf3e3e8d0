/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/frame_loop.hpp>

#include <chrono>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::error;

namespace orbitcore {

FrameLoop::~FrameLoop() {
    stop();
    if (ioThread.joinable()) {
        info("Waiting for frame loop thread to finish...");
        ioThread.join();
    }
}

FrameLoopStatus FrameLoop::status() const {
    return _status.load();
}

void FrameLoop::setFrameLimit(std::optional<std::size_t> limit) {
    frameLimit = limit;
}

void FrameLoop::setFrameCallback(FrameCallback callback) {
    onFrame = std::move(callback);
}

std::size_t FrameLoop::frameCount() const {
    return frames.load();
}

void FrameLoop::start() {
    FrameLoopStatus expected = FrameLoopStatus::STOPPED;
    if (!_status.compare_exchange_strong(expected, FrameLoopStatus::STARTING)) {
        return;
    }
    info("Starting frame loop at {} frames per second...", context.getConfig().getFramesPerSecond());

    // A previous run has already left io.run(); reap its thread and rearm the io_context
    if (ioThread.joinable()) {
        ioThread.join();
    }
    io.restart();
    frames.store(0);

    signals.cancel();
    initSignals();

    frameTimer = std::make_unique<asio::steady_timer>(io);
    scheduleFrame();

    _status.store(FrameLoopStatus::RUNNING);
    ioThread = std::thread([this]{
        io.run();
        _status.store(FrameLoopStatus::STOPPED);
        info("Frame loop stopped after {} frames.", frames.load());
    });
}

void FrameLoop::initSignals() {
    signals.async_wait([this](auto ec, int sig) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                error("Error receiving signal: {}", ec.message());
            }
            return;
        }
        info("Received signal {}.", sig);
        stop();
    });
}

void FrameLoop::scheduleFrame() {
    auto interval = std::chrono::milliseconds(1000 / context.getConfig().getFramesPerSecond());
    frameTimer->expires_after(interval);
    frameTimer->async_wait([this](const asio::error_code& ec) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                error("Frame timer error: {}", ec.message());
            }
            return;
        }
        runFrame();
        if (frameLimit && frames.load() >= *frameLimit) {
            info("Frame limit of {} reached.", *frameLimit);
            stop();
            return;
        }
        scheduleFrame();
    });
}

void FrameLoop::runFrame() {
    try {
        auto result = context.updateFrame(std::chrono::system_clock::now());
        if (result.rosterChanged) {
            info("Active TLE file changed at {}", formatInstantUTC(result.instant));
        }
        if (onFrame) {
            onFrame(result);
        }
    } catch (const std::exception& e) {
        error("Failed to compute frame: {}", e.what());
    }
    // A failed frame still counts toward the frame limit
    frames++;
}

void FrameLoop::stop() {
    FrameLoopStatus expected = FrameLoopStatus::RUNNING;
    if (!_status.compare_exchange_strong(expected, FrameLoopStatus::STOPPING)) {
        return;
    }
    debug("Stopping frame loop...");
    io.stop();
}

void FrameLoop::wait() {
    if (ioThread.joinable()) {
        ioThread.join();
    }
}

}
