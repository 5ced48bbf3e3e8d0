/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/ephemeris_table.hpp>

#include <algorithm>
#include <charconv>
#include <iterator>
#include <ranges>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using spdlog::info;
using spdlog::warn;

namespace orbitcore {

namespace {

double toDouble(std::string_view str) {
    double value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument("Couldn't convert value: '" + std::string(str) + "'");
    }
    return value;
}

// Whitespace-separated fields of a line
std::vector<std::string_view> tokens(std::string_view line) {
    std::vector<std::string_view> result;
    std::size_t pos = 0;
    while (pos < line.size()) {
        auto start = line.find_first_not_of(" \t\r", pos);
        if (start == std::string_view::npos) break;
        auto end = line.find_first_of(" \t\r", start);
        if (end == std::string_view::npos) end = line.size();
        result.push_back(line.substr(start, end - start));
        pos = end;
    }
    return result;
}

}

StateVector<Frame::J2000> parseStateVector(std::string_view text) {
    auto fields = tokens(text);
    if (fields.size() != 7) {
        throw std::invalid_argument(fmt::format("Expected 7 fields in state vector, found {}: '{}'",
                                                fields.size(), text));
    }

    double values[6];
    for (int i = 0; i < 6; i++) {
        values[i] = toDouble(fields[i + 1]) * 1000.0;
    }

    return {
        .position = {values[0], values[1], values[2]},
        .velocity = {values[3], values[4], values[5]},
        .timestamp = parseInstant(fields[0])
    };
}

std::string formatStateVector(const StateVector<Frame::J2000> &osv) {
    return fmt::format("{} {:.6f} {:.6f} {:.6f} {:.9f} {:.9f} {:.9f}",
                       formatInstant(osv.timestamp),
                       osv.position.x / 1000.0, osv.position.y / 1000.0, osv.position.z / 1000.0,
                       osv.velocity.x / 1000.0, osv.velocity.y / 1000.0, osv.velocity.z / 1000.0);
}

EphemerisTable EphemerisTable::parse(std::string_view text) {
    EphemerisTable table;
    bool inMeta = false;
    bool inCovariance = false;
    int skipped = 0;

    for (auto line : text | std::views::split('\n')) {
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        auto fields = tokens(lineStr);
        if (fields.empty()) continue;

        std::string_view keyword = fields.front();
        if (keyword == "META_START") { inMeta = true; continue; }
        if (keyword == "META_STOP") { inMeta = false; continue; }
        if (keyword == "COVARIANCE_START") { inCovariance = true; continue; }
        if (keyword == "COVARIANCE_STOP") { inCovariance = false; continue; }
        if (inMeta || inCovariance || keyword == "COMMENT") continue;

        // Header lines are "KEY = value"
        if (lineStr.find('=') != std::string::npos) continue;

        try {
            table.add(parseStateVector(lineStr));
        } catch (const std::invalid_argument &e) {
            warn("Skipping ephemeris line: {}", e.what());
            skipped++;
        }
    }

    info("Loaded {} ephemeris entries ({} skipped).", table.size(), skipped);
    return table;
}

void EphemerisTable::add(const StateVector<Frame::J2000> &osv) {
    auto pos = std::ranges::upper_bound(entries_, osv.timestamp, {}, &StateVector<Frame::J2000>::timestamp);
    entries_.insert(pos, osv);
}

bool EphemerisTable::empty() const {
    return entries_.empty();
}

std::size_t EphemerisTable::size() const {
    return entries_.size();
}

const std::vector<StateVector<Frame::J2000>>& EphemerisTable::entries() const {
    return entries_;
}

std::optional<StateVector<Frame::J2000>> EphemerisTable::closestEntry(time_point instant) const {
    if (entries_.empty()) {
        return std::nullopt;
    }

    auto after = std::ranges::lower_bound(entries_, instant, {}, &StateVector<Frame::J2000>::timestamp);
    if (after == entries_.begin()) {
        return *after;
    }
    if (after == entries_.end()) {
        return entries_.back();
    }

    auto before = std::prev(after);
    if (after->timestamp - instant < instant - before->timestamp) {
        return *after;
    }
    return *before;
}

}
