/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_EPHEMERIS_TABLE_HPP
#define __ORBITCORE_EPHEMERIS_TABLE_HPP

#include <orbitcore/frames.hpp>
#include <orbitcore/time_system.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orbitcore {

/**
 * Parses a state vector written as
 * "YYYY-MM-DDThh:mm:ss.sss x y z vx vy vz" with position in km and
 * velocity in km/s. The result is in meters and m/s.
 *
 * @throws std::invalid_argument if the line does not have seven fields or a
 *         field cannot be parsed
 */
StateVector<Frame::J2000> parseStateVector(std::string_view text);

/**
 * Inverse of parseStateVector.
 */
std::string formatStateVector(const StateVector<Frame::J2000> &osv);

/**
 * Table of J2000 state vectors read from an orbit ephemeris message (OEM).
 *
 * Only the data lines are used; the header, META blocks, COMMENT lines and
 * covariance blocks are skipped. Entries are kept sorted by timestamp.
 */
class EphemerisTable {
public:
    EphemerisTable() = default;

    /**
     * Parses OEM text. Data lines that cannot be parsed are logged and skipped.
     */
    static EphemerisTable parse(std::string_view text);

    void add(const StateVector<Frame::J2000> &osv);

    bool empty() const;
    std::size_t size() const;
    const std::vector<StateVector<Frame::J2000>>& entries() const;

    /**
     * Entry whose timestamp is nearest to the instant. Ties go to the
     * earlier entry.
     *
     * @return The entry, or std::nullopt if the table is empty
     */
    std::optional<StateVector<Frame::J2000>> closestEntry(time_point instant) const;

private:
    std::vector<StateVector<Frame::J2000>> entries_;
};

}

#endif
