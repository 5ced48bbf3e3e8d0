/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/data_source.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace orbitcore {

namespace {

std::string lowercase(std::string_view text) {
    std::string result(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

}

std::string toString(DataSource source) {
    switch (source) {
        case DataSource::Telemetry:
            return "Telemetry";
        case DataSource::EphemerisTable:
            return "EphemerisTable";
        case DataSource::TwoLineElements:
            return "TwoLineElements";
        case DataSource::ManualVector:
            return "ManualVector";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream &os, const DataSource &source) {
    return os << toString(source);
}

DataSource parseDataSource(std::string_view name) {
    std::string value = lowercase(name);
    if (value == "telemetry") {
        return DataSource::Telemetry;
    } else if (value == "oem" || value == "ephemeristable" || value == "ephemeris") {
        return DataSource::EphemerisTable;
    } else if (value == "tle" || value == "twolineelements") {
        return DataSource::TwoLineElements;
    } else if (value == "osv" || value == "manualvector" || value == "manual") {
        return DataSource::ManualVector;
    }
    throw std::invalid_argument("Unknown data source: " + std::string(name));
}

StateVector<Frame::J2000> defaultTelemetry() {
    using namespace std::chrono;
    return {
        .position = {-4228282.012, 4080666.827, -3421191.697},
        .velocity = {-1904.50887, -5821.53009, -4594.77013},
        .timestamp = sys_days{year{2021}/November/20} + hours{19} + minutes{28} + seconds{4}
    };
}

DataSourceSelector::DataSourceSelector()
    : telemetry(defaultTelemetry()), manualVector(defaultTelemetry()) {}

DataSource DataSourceSelector::getSource() const {
    return source;
}

void DataSourceSelector::setSource(DataSource s) {
    source = s;
}

const StateVector<Frame::J2000>& DataSourceSelector::getTelemetry() const {
    return telemetry;
}

void DataSourceSelector::setTelemetry(const StateVector<Frame::J2000> &osv) {
    telemetry = osv;
}

const EphemerisTable& DataSourceSelector::getEphemerisTable() const {
    return ephemerisTable;
}

void DataSourceSelector::setEphemerisTable(EphemerisTable table) {
    ephemerisTable = std::move(table);
}

const std::optional<Satellite>& DataSourceSelector::getTarget() const {
    return target;
}

void DataSourceSelector::setTarget(std::optional<Satellite> t) {
    target = std::move(t);
}

const StateVector<Frame::J2000>& DataSourceSelector::getManualVector() const {
    return manualVector;
}

void DataSourceSelector::setManualVector(const StateVector<Frame::J2000> &osv) {
    manualVector = osv;
}

bool DataSourceSelector::producesStateAtInstant() const {
    return source == DataSource::TwoLineElements;
}

std::optional<StateVector<Frame::J2000>> DataSourceSelector::createOsv(
        time_point instant, const std::optional<NutationTerms> &nutation) const {
    switch (source) {
        case DataSource::Telemetry:
            return telemetry;

        case DataSource::EphemerisTable: {
            auto entry = ephemerisTable.closestEntry(instant);
            if (!entry) {
                debug("Ephemeris table is empty");
            }
            return entry;
        }

        case DataSource::TwoLineElements:
            if (!target) {
                debug("No TLE target selected");
                return std::nullopt;
            }
            try {
                return target->getJ2000(instant, nutation);
            } catch (const SGP4Exception &e) {
                warn("Failed to propagate {}: {}", target->getName(), e.what());
                return std::nullopt;
            }

        case DataSource::ManualVector:
            return manualVector;
    }
    return std::nullopt;
}

}
