/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_ORBIT_TRAIL_HPP
#define __ORBITCORE_ORBIT_TRAIL_HPP

#include <orbitcore/frames.hpp>
#include <orbitcore/kepler.hpp>

#include <optional>
#include <vector>

namespace orbitcore {

// Lower bound on the number of trail samples per orbital period
constexpr int MIN_TRAIL_POINTS_PER_PERIOD = 500;

/**
 * Samples the orbit described by a set of Keplerian elements around an
 * instant, for drawing the orbit path.
 *
 * Samples run from orbitsBefore periods before the instant to orbitsAfter
 * periods after it, with max(500, orbitPoints / 2) samples per period.
 * Samples where Kepler's equation does not converge are left out.
 *
 * @return Sample positions (m) in the display frame
 */
std::vector<Vec3> sampleOrbitTrail(const KeplerianElements &elements, time_point instant,
                                   int orbitsBefore, int orbitsAfter, int orbitPoints,
                                   DisplayFrame displayFrame,
                                   const std::optional<NutationTerms> &nutation = std::nullopt);

}

#endif
