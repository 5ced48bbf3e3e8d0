/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_SIMULATION_CLOCK_HPP
#define __ORBITCORE_SIMULATION_CLOCK_HPP

#include <orbitcore/time_system.hpp>

#include <chrono>
#include <optional>
#include <ostream>

namespace orbitcore {

using seconds_d = std::chrono::duration<double>;

/**
 * How the clock's base instant is chosen.
 */
enum class ClockMode {
    Idle,           ///< No instant yet
    FreeRunning,    ///< Base follows the wall clock
    Manual,         ///< Base is an operator-supplied calendar instant
    EpochLocked     ///< Base is the first epoch of a loaded TLE set
};

std::ostream& operator<<(std::ostream &os, const ClockMode &mode);

/**
 * Operator offset added on top of the base instant.
 */
struct ManualDelta {
    int days = 0;
    int hours = 0;
    int minutes = 0;
    double seconds = 0.0;

    seconds_d total() const;

    bool operator==(const ManualDelta &other) const = default;
};

/**
 * Owns the simulated instant.
 *
 * The visible instant is base + manual delta + warp offset. The warp offset
 * grows by the warp rate once per frame while warp is enabled and is only
 * cleared by reset(). Wall time is always handed in by the caller; the clock
 * never samples it.
 */
class SimulationClock {
public:
    SimulationClock() = default;

    ClockMode getMode() const;
    bool isIdle() const;

    /**
     * The simulated instant.
     * @throws std::logic_error if the clock is Idle
     */
    time_point currentInstant() const;

    time_point getBase() const;
    seconds_d getWarpOffset() const;

    bool isWarpEnabled() const;
    void setWarpEnabled(bool enabled);

    double getWarpRate() const;
    void setWarpRate(double secondsPerFrame);

    const ManualDelta& getManualDelta() const;
    void setManualDelta(const ManualDelta &delta);

    /**
     * Switches to FreeRunning with the base at the wall clock. Loading a TLE
     * set no longer moves the base while free running is requested.
     */
    void startFreeRunning(time_point wallNow);

    /**
     * Switches to Manual with the given calendar instant as base and clears
     * the free running request.
     */
    void setManualInstant(time_point instant);

    /**
     * Clears the free running request and returns to the epoch of the loaded
     * TLE set, or to the manual instant when no set is loaded.
     */
    void stopFreeRunning();

    bool isFreeRunningRequested() const;

    /**
     * A TLE set was loaded. Moves to EpochLocked at the epoch unless free
     * running has been requested.
     */
    void onTleSetLoaded(time_point epoch);

    /**
     * Per-frame transition: re-seeds the base from the wall clock when free
     * running and accumulates the warp offset when warp is enabled.
     */
    void advanceFrame(time_point wallNow);

    /**
     * Clears the warp offset and manual delta, forgets the locked epoch and
     * follows the wall clock again. The free running request is left as it
     * was.
     */
    void reset(time_point wallNow);

private:
    ClockMode mode = ClockMode::Idle;
    time_point base;
    std::optional<time_point> manualInstant;
    std::optional<time_point> lockedEpoch;
    bool freeRunningRequested = false;
    bool warpEnabled = false;
    double warpRate = 0.0;
    seconds_d warpOffset{0.0};
    ManualDelta manualDelta;
};

}

#endif
