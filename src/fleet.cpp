/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/fleet.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace orbitcore {

std::vector<FleetEntry> propagateFleet(const std::vector<Satellite> &roster, time_point instant,
                                       const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, instant);

    std::vector<FleetEntry> fleet;
    fleet.reserve(roster.size());

    for (const auto &satellite : roster) {
        StateVector<Frame::J2000> j2000;
        try {
            j2000 = satellite.getJ2000(instant, n);
        } catch (const SGP4Exception &e) {
            debug("Skipping {} ({}): {}", satellite.getName(), satellite.getNoradID(), e.what());
            continue;
        }

        if (!j2000.isFinite()) {
            warn("Skipping {} ({}): non-finite state", satellite.getName(), satellite.getNoradID());
            continue;
        }

        auto ecef = osvJ2000ToECEF(j2000, n);
        fleet.push_back({
            .name = satellite.getName(),
            .noradID = satellite.getNoradID(),
            .color = satellite.getColor(),
            .j2000 = j2000,
            .ecef = ecef,
            .geodetic = cartToWgs84(ecef.position)
        });
    }

    if (fleet.size() < roster.size()) {
        debug("Propagated {} of {} satellites", fleet.size(), roster.size());
    }
    return fleet;
}

}
