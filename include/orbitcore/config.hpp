/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_CONFIG_HPP
#define __ORBITCORE_CONFIG_HPP

#include <orbitcore/data_source.hpp>
#include <orbitcore/frames.hpp>
#include <orbitcore/kepler.hpp>
#include <orbitcore/simulation_clock.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace orbitcore {

/**
 * Keplerian elements entered by the operator. The semi-major axis is in
 * kilometers, angles in degrees.
 */
struct KeplerOverride {
    double semiMajorAxisInKilometers = 6778.0;
    double eccentricity = 0.0005;
    double inclination = 51.6;
    double rightAscensionOfNode = 0.0;
    double argumentOfPeriapsis = 0.0;
    double meanAnomaly = 0.0;

    /**
     * Elements in SI units with the given epoch.
     */
    KeplerianElements toElements(time_point epoch) const;
};

class Config {
public:
    Config() = default;
    ~Config() = default;

    DataSource getDataSource() const;
    void setDataSource(DataSource source);

    DisplayFrame getDisplayFrame() const;
    void setDisplayFrame(DisplayFrame frame);

    bool getWarpEnabled() const;
    void setWarpEnabled(bool enabled);

    double getWarpSeconds() const;
    void setWarpSeconds(double seconds);

    bool getFreeRunning() const;
    void setFreeRunning(bool enabled);

    bool hasManualInstant() const;
    time_point getManualInstant() const;
    void setManualInstant(time_point instant);

    const ManualDelta& getManualDelta() const;
    void setManualDelta(const ManualDelta &delta);

    bool getKeplerOverrideEnabled() const;
    void setKeplerOverrideEnabled(bool enabled);

    const KeplerOverride& getKeplerOverride() const;
    void setKeplerOverride(const KeplerOverride &elements);

    int getOrbitsBefore() const;
    void setOrbitsBefore(int orbits);

    int getOrbitsAfter() const;
    void setOrbitsAfter(int orbits);

    int getOrbitPoints() const;
    void setOrbitPoints(int points);

    std::string getTargetName() const;
    void setTargetName(const std::string &name);

    bool getVerbose() const;
    void setVerbose(bool);

    int getFramesPerSecond() const;
    void setFramesPerSecond(int fps);

private:
    DataSource dataSource = DataSource::Telemetry;
    DisplayFrame displayFrame = DisplayFrame::EarthFixed;
    bool warpEnabled = false;
    double warpSeconds = 1.0;
    bool freeRunning = false;
    std::optional<time_point> manualInstant;
    ManualDelta manualDelta;
    bool keplerOverrideEnabled = false;
    KeplerOverride keplerOverride;
    int orbitsBefore = 1;
    int orbitsAfter = 1;
    int orbitPoints = 100;
    std::string targetName;
    bool verbose = false;
    int framesPerSecond = 10;
};

}

#endif
