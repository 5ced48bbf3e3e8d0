/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/simulation_context.hpp>
#include <orbitcore/orbit_trail.hpp>

#include <algorithm>
#include <iomanip>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace orbitcore {

std::optional<Vec3> FrameResult::primaryPosition() const {
    if (!primary) {
        return std::nullopt;
    }
    if (displayFrame == DisplayFrame::EarthFixed) {
        return primary->ecef.position.vec();
    }
    return primary->propagated.position.vec();
}

std::ostream& operator<<(std::ostream &os, const FrameResult &result) {
    os << formatInstantUTC(result.instant)
       << "  JT " << std::fixed << std::setprecision(6) << result.julian.jt
       << "  GAST " << std::setprecision(4) << result.siderealTime << " deg";
    if (result.primary) {
        const auto &g = result.primary->geodetic;
        os << "  lat " << g.latInDegrees << "  lon " << g.lonInDegrees
           << "  alt " << std::setprecision(3) << g.altInMeters / 1000.0 << " km";
    } else {
        os << "  (no primary state)";
    }
    os << "  fleet " << result.fleet.size()
       << std::setprecision(2)
       << "  sun " << result.sun.subPoint.latInDegrees << "," << result.sun.subPoint.lonInDegrees
       << "  moon " << result.moon.subPoint.latInDegrees << "," << result.moon.subPoint.lonInDegrees;
    return os;
}

SimulationContext::SimulationContext(Config config) : config(std::move(config)) {}

Config& SimulationContext::getConfig() {
    return config;
}

const Config& SimulationContext::getConfig() const {
    return config;
}

SimulationClock& SimulationContext::getClock() {
    return clock;
}

const SimulationClock& SimulationContext::getClock() const {
    return clock;
}

DataSourceSelector& SimulationContext::getDataSourceSelector() {
    return selector;
}

const TimeSlicedFileSet& SimulationContext::getFileSet() const {
    return fileSet;
}

const std::vector<Satellite>& SimulationContext::getRoster() const {
    return roster;
}

void SimulationContext::start(time_point wallNow) {
    if (config.getFreeRunning()) {
        clock.startFreeRunning(wallNow);
    } else {
        clock.setManualInstant(config.hasManualInstant() ? config.getManualInstant() : wallNow);
    }
    info("Simulation clock started in {} mode at {}",
         clock.getMode() == ClockMode::FreeRunning ? "free running" : "manual",
         formatInstantUTC(clock.currentInstant()));
}

void SimulationContext::reset(time_point wallNow) {
    config.setWarpEnabled(false);
    config.setManualDelta(ManualDelta{});
    config.setManualInstant(wallNow);
    clock.reset(wallNow);

    if (fileSet.update(clock.currentInstant())) {
        reloadRoster();
    }
    info("Simulation clock reset to {}", formatInstantUTC(wallNow));
}

void SimulationContext::loadTleFiles(const std::vector<std::pair<std::string, std::string>> &files,
                                     time_point wallNow) {
    // Build the new set first so a bad file leaves the current one in place
    TimeSlicedFileSet newSet;
    for (const auto &[filename, content] : files) {
        newSet.addFile(filename, content);
    }
    fileSet = std::move(newSet);

    if (clock.isIdle()) {
        start(wallNow);
    }
    if (auto epoch = fileSet.earliestEpoch()) {
        clock.onTleSetLoaded(*epoch);
    }

    fileSet.update(clock.currentInstant());
    reloadRoster();
}

void SimulationContext::loadTleSet(const std::string &filename, const std::string &text, time_point wallNow) {
    loadTleFiles({{filename, text}}, wallNow);
}

void SimulationContext::setColorMap(const std::string &map) {
    colorMap = map;
    if (!roster.empty()) {
        applyColorMap(roster, colorMap);
    }
}

void SimulationContext::reloadRoster() {
    const TleFile *file = fileSet.currentFile();
    if (file == nullptr) {
        roster.clear();
        return;
    }

    auto loaded = parseTLEDatabase(file->content);
    if (!colorMap.empty()) {
        applyColorMap(loaded, colorMap);
    }
    roster = std::move(loaded);
    info("Roster loaded from {}: {} satellites", file->filename, roster.size());

    // The primary TLE target is the configured satellite, or the first one
    std::string targetName = config.getTargetName();
    auto target = std::ranges::find_if(roster, [&targetName](const Satellite &s) {
        return s.getName() == targetName;
    });
    if (target != roster.end()) {
        selector.setTarget(*target);
    } else if (!roster.empty()) {
        if (!targetName.empty()) {
            warn("Target {} not found in {}; using {}", targetName, file->filename, roster.front().getName());
        }
        selector.setTarget(roster.front());
    }
}

void SimulationContext::applyConfigToClock(time_point wallNow) {
    if (config.getFreeRunning() && !clock.isFreeRunningRequested()) {
        clock.startFreeRunning(wallNow);
    } else if (!config.getFreeRunning() && clock.isFreeRunningRequested()) {
        clock.stopFreeRunning();
    }
    clock.setWarpEnabled(config.getWarpEnabled());
    clock.setWarpRate(config.getWarpSeconds());
    clock.setManualDelta(config.getManualDelta());
}

std::optional<PrimaryState> SimulationContext::computePrimary(time_point instant, const NutationTerms &nutation) {
    bool overrideElements = config.getKeplerOverrideEnabled();
    if (overrideElements && config.getDataSource() != DataSource::ManualVector) {
        info("Keplerian override enabled; switching data source to {}", toString(DataSource::ManualVector));
        config.setDataSource(DataSource::ManualVector);
    }
    selector.setSource(config.getDataSource());

    auto osv = selector.createOsv(instant, nutation);
    if (!osv) {
        return std::nullopt;
    }

    KeplerianElements kepler = overrideElements
        ? config.getKeplerOverride().toElements(instant)
        : osvToKepler(*osv);

    std::optional<StateVector<Frame::J2000>> propagated;
    if (!overrideElements && selector.producesStateAtInstant()) {
        propagated = osv;
    } else {
        propagated = propagate(kepler, instant);
    }

    if (!propagated || !propagated->isFinite()) {
        debug("Primary target could not be propagated to {}", formatInstant(instant));
        return std::nullopt;
    }

    auto ecef = osvJ2000ToECEF(*propagated, nutation);
    return PrimaryState{
        .osv = *osv,
        .kepler = kepler,
        .propagated = *propagated,
        .ecef = ecef,
        .geodetic = cartToWgs84(ecef.position)
    };
}

FrameResult SimulationContext::updateFrame(time_point wallNow) {
    if (clock.isIdle()) {
        start(wallNow);
    }
    applyConfigToClock(wallNow);
    clock.advanceFrame(wallNow);

    FrameResult result;
    result.instant = clock.currentInstant();
    result.displayFrame = config.getDisplayFrame();

    result.rosterChanged = fileSet.update(result.instant);
    if (result.rosterChanged) {
        reloadRoster();
    }

    result.julian = computeJulianTime(result.instant);
    result.nutation = nutationTerms(julianCenturies(result.julian.jt));
    result.siderealTime = computeSiderealTime(0.0, result.julian.jd, result.julian.jt, result.nutation);

    result.primary = computePrimary(result.instant, result.nutation);
    result.fleet = propagateFleet(roster, result.instant, result.nutation);
    result.sun = locateSun(result.instant, result.nutation);
    result.moon = locateMoon(result.instant, result.nutation);

    if (result.primary) {
        result.orbitTrail = sampleOrbitTrail(result.primary->kepler, result.instant,
                                             config.getOrbitsBefore(), config.getOrbitsAfter(),
                                             config.getOrbitPoints(), result.displayFrame, result.nutation);
    }

    debug("Frame {}: source {}, fleet {}/{}, trail {} points",
          formatInstant(result.instant), toString(config.getDataSource()),
          result.fleet.size(), roster.size(), result.orbitTrail.size());
    return result;
}

}
