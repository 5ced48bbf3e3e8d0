/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_FLEET_HPP
#define __ORBITCORE_FLEET_HPP

#include <orbitcore/frames.hpp>
#include <orbitcore/satellite.hpp>

#include <optional>
#include <string>
#include <vector>

namespace orbitcore {

/**
 * State of one fleet member at the frame instant.
 */
struct FleetEntry {
    std::string name;
    int noradID;
    Color color;
    StateVector<Frame::J2000> j2000;
    StateVector<Frame::ECEF> ecef;
    Geodetic geodetic;
};

/**
 * Propagates a roster of satellites to one instant.
 *
 * Each satellite goes through SGP4 (TEME, km), is scaled to meters and
 * rotated to J2000 and ECEF, and is placed on the WGS84 ellipsoid. A
 * satellite whose propagation throws or produces a non-finite state is left
 * out of the result; the rest of the roster is unaffected.
 *
 * @param roster Satellites to propagate
 * @param instant Instant shared by every satellite
 * @param nutation Nutation terms for the instant; computed when absent
 */
std::vector<FleetEntry> propagateFleet(const std::vector<Satellite> &roster, time_point instant,
                                       const std::optional<NutationTerms> &nutation = std::nullopt);

}

#endif
