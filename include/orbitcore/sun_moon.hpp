/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Low-precision Sun and Moon positions.
 */

#ifndef __ORBITCORE_SUN_MOON_HPP
#define __ORBITCORE_SUN_MOON_HPP

#include <orbitcore/frames.hpp>

#include <optional>

namespace orbitcore {

constexpr double ASTRONOMICAL_UNIT = 1.495978707e11;   // meters
constexpr double J2000_OBLIQUITY = 23.4392911;         // Obliquity of the ecliptic at J2000.0 (degrees)

/**
 * Where the Sun or the Moon is at one instant.
 */
struct CelestialPosition {
    Vector3<Frame::J2000> position;  ///< Geocentric position (m)
    double rightAscension;           ///< Degrees [0, 360), true equator and equinox of date
    double declination;              ///< Degrees, true equator of date
    Geodetic subPoint;               ///< Where the body is at the zenith; altitude is its height above the ellipsoid
};

/**
 * Geocentric Sun position from the Standish mean elements of the
 * Earth-Moon barycentre. Accurate to about 0.01 degrees.
 */
Vector3<Frame::J2000> sunPositionJ2000(time_point instant);

/**
 * Geocentric Moon position from a truncated lunar theory (main terms of
 * longitude, latitude and distance). Accurate to a few arcminutes and a few
 * hundred kilometers.
 */
Vector3<Frame::J2000> moonPositionJ2000(time_point instant);

CelestialPosition locateSun(time_point instant, const std::optional<NutationTerms> &nutation = std::nullopt);
CelestialPosition locateMoon(time_point instant, const std::optional<NutationTerms> &nutation = std::nullopt);

}

#endif
