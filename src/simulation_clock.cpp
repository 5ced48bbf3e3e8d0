/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/simulation_clock.hpp>

#include <stdexcept>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace orbitcore {

std::ostream& operator<<(std::ostream &os, const ClockMode &mode) {
    switch (mode) {
        case ClockMode::Idle:
            os << "Idle";
            break;
        case ClockMode::FreeRunning:
            os << "FreeRunning";
            break;
        case ClockMode::Manual:
            os << "Manual";
            break;
        case ClockMode::EpochLocked:
            os << "EpochLocked";
            break;
    }
    return os;
}

seconds_d ManualDelta::total() const {
    return seconds_d{days * SECONDS_PER_DAY + hours * 3600.0 + minutes * 60.0 + seconds};
}

ClockMode SimulationClock::getMode() const {
    return mode;
}

bool SimulationClock::isIdle() const {
    return mode == ClockMode::Idle;
}

time_point SimulationClock::currentInstant() const {
    if (mode == ClockMode::Idle) {
        throw std::logic_error("Simulation clock has not been started");
    }
    return base + std::chrono::duration_cast<time_point::duration>(manualDelta.total() + warpOffset);
}

time_point SimulationClock::getBase() const {
    return base;
}

seconds_d SimulationClock::getWarpOffset() const {
    return warpOffset;
}

bool SimulationClock::isWarpEnabled() const {
    return warpEnabled;
}

void SimulationClock::setWarpEnabled(bool enabled) {
    warpEnabled = enabled;
}

double SimulationClock::getWarpRate() const {
    return warpRate;
}

void SimulationClock::setWarpRate(double secondsPerFrame) {
    warpRate = secondsPerFrame;
}

const ManualDelta& SimulationClock::getManualDelta() const {
    return manualDelta;
}

void SimulationClock::setManualDelta(const ManualDelta &delta) {
    manualDelta = delta;
}

void SimulationClock::startFreeRunning(time_point wallNow) {
    freeRunningRequested = true;
    mode = ClockMode::FreeRunning;
    base = wallNow;
}

void SimulationClock::setManualInstant(time_point instant) {
    freeRunningRequested = false;
    manualInstant = instant;
    lockedEpoch.reset();
    mode = ClockMode::Manual;
    base = instant;
}

void SimulationClock::stopFreeRunning() {
    freeRunningRequested = false;
    if (lockedEpoch) {
        mode = ClockMode::EpochLocked;
        base = *lockedEpoch;
    } else if (manualInstant) {
        mode = ClockMode::Manual;
        base = *manualInstant;
    } else if (mode == ClockMode::FreeRunning) {
        // Keep the last wall clock sample as a manual base
        manualInstant = base;
        mode = ClockMode::Manual;
    }
}

bool SimulationClock::isFreeRunningRequested() const {
    return freeRunningRequested;
}

void SimulationClock::onTleSetLoaded(time_point epoch) {
    lockedEpoch = epoch;
    if (freeRunningRequested) {
        debug("TLE set loaded while free running; keeping wall clock base");
        return;
    }
    mode = ClockMode::EpochLocked;
    base = epoch;
    debug("Clock locked to TLE epoch {}", formatInstant(epoch));
}

void SimulationClock::advanceFrame(time_point wallNow) {
    if (mode == ClockMode::FreeRunning) {
        base = wallNow;
    }
    if (warpEnabled && mode != ClockMode::Idle) {
        warpOffset += seconds_d{warpRate};
    }
}

void SimulationClock::reset(time_point wallNow) {
    warpOffset = seconds_d{0.0};
    manualDelta = ManualDelta{};
    // The wall clock becomes the new manual instant; a TLE set loaded later
    // still locks to its epoch unless free running was requested
    manualInstant = wallNow;
    lockedEpoch.reset();
    mode = ClockMode::FreeRunning;
    base = wallNow;
}

}
