/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/orbit_trail.hpp>

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace orbitcore {

std::vector<Vec3> sampleOrbitTrail(const KeplerianElements &elements, time_point instant,
                                   int orbitsBefore, int orbitsAfter, int orbitPoints,
                                   DisplayFrame displayFrame,
                                   const std::optional<NutationTerms> &nutation) {
    using namespace std::chrono;

    std::vector<Vec3> trail;
    if (elements.semiMajorAxis <= 0.0 || elements.eccentricity >= 1.0) {
        return trail;
    }

    NutationTerms n = resolveNutation(nutation, instant);
    double period = computePeriod(elements.semiMajorAxis, elements.mu);
    int pointsPerPeriod = std::max(MIN_TRAIL_POINTS_PER_PERIOD, orbitPoints / 2);
    double step = period / (pointsPerPeriod + 0.01);

    int skipped = 0;
    for (double offset = -period * orbitsBefore; offset <= period * orbitsAfter; offset += step) {
        auto sampleTime = instant + duration_cast<time_point::duration>(duration<double>{offset});
        auto osv = propagate(elements, sampleTime);
        if (!osv) {
            skipped++;
            continue;
        }

        if (displayFrame == DisplayFrame::EarthFixed) {
            trail.push_back(posJ2000ToECEF(osv->position, sampleTime, n).vec());
        } else {
            trail.push_back(osv->position.vec());
        }
    }

    if (skipped > 0) {
        debug("Orbit trail skipped {} samples that did not converge", skipped);
    }
    return trail;
}

}
