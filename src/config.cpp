/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/config.hpp>

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

using spdlog::warn;

namespace orbitcore {

namespace {

template <typename T>
T clampSetting(std::string_view name, T value, T low, T high) {
    T clamped = std::clamp(value, low, high);
    if (clamped != value) {
        warn("{} {} is out of range [{}, {}], using {}", name, value, low, high, clamped);
    }
    return clamped;
}

}

KeplerianElements KeplerOverride::toElements(time_point epoch) const {
    KeplerianElements elements;
    elements.semiMajorAxis = semiMajorAxisInKilometers * 1000.0;
    elements.eccentricity = eccentricity;
    elements.inclination = inclination;
    elements.rightAscensionOfNode = rightAscensionOfNode;
    elements.argumentOfPeriapsis = argumentOfPeriapsis;
    elements.meanAnomaly = meanAnomaly;
    elements.mu = EARTH_MU;
    elements.epoch = epoch;
    return elements;
}

DataSource Config::getDataSource() const {
    return dataSource;
}

void Config::setDataSource(DataSource source) {
    dataSource = source;
}

DisplayFrame Config::getDisplayFrame() const {
    return displayFrame;
}

void Config::setDisplayFrame(DisplayFrame frame) {
    displayFrame = frame;
}

bool Config::getWarpEnabled() const {
    return warpEnabled;
}

void Config::setWarpEnabled(bool enabled) {
    warpEnabled = enabled;
}

double Config::getWarpSeconds() const {
    return warpSeconds;
}

void Config::setWarpSeconds(double seconds) {
    warpSeconds = clampSetting("Warp seconds", seconds, -60.0, 60.0);
}

bool Config::getFreeRunning() const {
    return freeRunning;
}

void Config::setFreeRunning(bool enabled) {
    freeRunning = enabled;
}

bool Config::hasManualInstant() const {
    return manualInstant.has_value();
}

time_point Config::getManualInstant() const {
    if (!manualInstant) {
        throw std::logic_error("No manual instant configured");
    }
    return *manualInstant;
}

void Config::setManualInstant(time_point instant) {
    manualInstant = instant;
}

const ManualDelta& Config::getManualDelta() const {
    return manualDelta;
}

void Config::setManualDelta(const ManualDelta &delta) {
    manualDelta = delta;
}

bool Config::getKeplerOverrideEnabled() const {
    return keplerOverrideEnabled;
}

void Config::setKeplerOverrideEnabled(bool enabled) {
    keplerOverrideEnabled = enabled;
}

const KeplerOverride& Config::getKeplerOverride() const {
    return keplerOverride;
}

void Config::setKeplerOverride(const KeplerOverride &elements) {
    keplerOverride = elements;
}

int Config::getOrbitsBefore() const {
    return orbitsBefore;
}

void Config::setOrbitsBefore(int orbits) {
    orbitsBefore = clampSetting("Orbits before", orbits, 0, 10);
}

int Config::getOrbitsAfter() const {
    return orbitsAfter;
}

void Config::setOrbitsAfter(int orbits) {
    orbitsAfter = clampSetting("Orbits after", orbits, 0, 10);
}

int Config::getOrbitPoints() const {
    return orbitPoints;
}

void Config::setOrbitPoints(int points) {
    orbitPoints = clampSetting("Orbit points", points, 10, 10000);
}

std::string Config::getTargetName() const {
    return targetName;
}

void Config::setTargetName(const std::string &name) {
    targetName = name;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

int Config::getFramesPerSecond() const {
    return framesPerSecond;
}

void Config::setFramesPerSecond(int fps) {
    framesPerSecond = clampSetting("Frames per second", fps, 1, 60);
}

}
