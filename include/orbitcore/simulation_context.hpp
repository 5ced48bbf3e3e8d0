/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_SIMULATION_CONTEXT_HPP
#define __ORBITCORE_SIMULATION_CONTEXT_HPP

#include <orbitcore/config.hpp>
#include <orbitcore/data_source.hpp>
#include <orbitcore/file_set.hpp>
#include <orbitcore/fleet.hpp>
#include <orbitcore/frames.hpp>
#include <orbitcore/kepler.hpp>
#include <orbitcore/satellite.hpp>
#include <orbitcore/simulation_clock.hpp>
#include <orbitcore/sun_moon.hpp>
#include <orbitcore/time_system.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orbitcore {

/**
 * Primary target state for one frame.
 */
struct PrimaryState {
    StateVector<Frame::J2000> osv;          ///< State produced by the data source
    KeplerianElements kepler;               ///< Elements used for propagation and the orbit trail
    StateVector<Frame::J2000> propagated;   ///< State at the frame instant
    StateVector<Frame::ECEF> ecef;          ///< propagated, rotated to ECEF
    Geodetic geodetic;                      ///< Sub-satellite point and altitude
};

/**
 * Everything computed for one frame.
 */
struct FrameResult {
    time_point instant;
    JulianTime julian;
    NutationTerms nutation;
    double siderealTime;                    ///< Greenwich apparent sidereal time, degrees
    DisplayFrame displayFrame;
    bool rosterChanged;                     ///< A different TLE file became active this frame
    std::optional<PrimaryState> primary;    ///< Empty when the data source produced nothing
    std::vector<FleetEntry> fleet;
    std::vector<Vec3> orbitTrail;           ///< Meters, in the display frame
    CelestialPosition sun;
    CelestialPosition moon;

    /**
     * Primary position (m) in the display frame.
     */
    std::optional<Vec3> primaryPosition() const;
};

std::ostream& operator<<(std::ostream &os, const FrameResult &result);

/**
 * All mutable simulation state: configuration, clock, data sources, the
 * time-sliced TLE files and the active roster. One updateFrame() call runs
 * the whole per-frame pipeline against a single instant.
 */
class SimulationContext {
public:
    explicit SimulationContext(Config config = Config{});

    Config& getConfig();
    const Config& getConfig() const;
    SimulationClock& getClock();
    const SimulationClock& getClock() const;
    DataSourceSelector& getDataSourceSelector();
    const TimeSlicedFileSet& getFileSet() const;
    const std::vector<Satellite>& getRoster() const;

    /**
     * Seeds the clock from the configuration: free running at wallNow, or
     * manual at the configured instant (wallNow when none is configured).
     */
    void start(time_point wallNow);

    /**
     * Returns the simulation to the wall clock: warp is switched off, the
     * warp offset and manual deltas are cleared, and wallNow becomes the
     * configured manual instant.
     */
    void reset(time_point wallNow);

    /**
     * Replaces the time-sliced file set. The clock is locked to the earliest
     * file's epoch unless free running is configured, and the roster is
     * loaded from the file covering the resulting instant.
     *
     * @param files Pairs of file name and TLE text
     * @throws std::invalid_argument if a file holds no parsable TLE
     */
    void loadTleFiles(const std::vector<std::pair<std::string, std::string>> &files, time_point wallNow);

    /**
     * Loads a single TLE text as a one-file set.
     */
    void loadTleSet(const std::string &filename, const std::string &text, time_point wallNow);

    /**
     * Colour lines ("name,r,g,b") applied to the roster now and after every
     * roster reload.
     */
    void setColorMap(const std::string &colorMap);

    /**
     * Runs one frame: applies configuration to the clock, advances it,
     * switches TLE files when needed, and computes the primary target,
     * fleet and orbit trail at the resulting instant.
     */
    FrameResult updateFrame(time_point wallNow);

private:
    Config config;
    SimulationClock clock;
    DataSourceSelector selector;
    TimeSlicedFileSet fileSet;
    std::vector<Satellite> roster;
    std::string colorMap;

    void applyConfigToClock(time_point wallNow);
    void reloadRoster();
    std::optional<PrimaryState> computePrimary(time_point instant, const NutationTerms &nutation);
};

}

#endif
