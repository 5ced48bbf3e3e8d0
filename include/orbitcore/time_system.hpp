/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_TIME_SYSTEM_HPP
#define __ORBITCORE_TIME_SYSTEM_HPP

#include <chrono>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace orbitcore {

using time_point = std::chrono::system_clock::time_point;

// Astronomical constants
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double UNIX_EPOCH_JD = 2440587.5;                 // Julian Date of 1970-01-01T00:00:00Z
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU polynomial correction coefficients for long-term variations in Earth's rotation
constexpr double GMST_T2_COEFF = 0.000387933;   // Quadratic correction for precession (T² term)
constexpr double GMST_T3_DIVISOR = 38710000.0;  // Cubic correction divisor (T³ term)

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;
constexpr double ARCSECONDS_TO_DEGREES = 1.0 / 3600.0;

/**
 * Julian Date of an instant, split the way the sidereal time and nutation
 * formulas consume it.
 */
struct JulianTime {
    double jd;  ///< Julian Date at 0h UT of the instant's calendar day
    double jt;  ///< Julian Date including the fraction of the day
};

/**
 * Nutation of the Earth's axis and the mean obliquity of the ecliptic.
 * All values are in degrees.
 */
struct NutationTerms {
    double dpsi;  ///< Nutation in longitude
    double deps;  ///< Nutation in obliquity
    double eps;   ///< Mean obliquity of the ecliptic
};

/**
 * Computes the Julian Date and Julian Time of an instant using the Meeus
 * algorithm. January and February are treated as months 13 and 14 of the
 * previous year.
 */
JulianTime computeJulianTime(time_point instant);

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(time_point tp);

/**
 * Converts a Julian Date to a time_point (microsecond precision).
 */
time_point fromJulianDate(double julianDate);

/**
 * Julian centuries since J2000.0.
 */
double julianCenturies(double julianTime);

/**
 * Converts a Julian Date to the Gregorian calendar day it falls on,
 * returned as midnight UTC of that day.
 */
time_point julianToGregorian(double julianDate);

/**
 * Mean obliquity of the ecliptic (degrees) for T Julian centuries since J2000.0.
 */
double meanObliquity(double T);

/**
 * Nutation in longitude and obliquity for T Julian centuries since J2000.0.
 */
NutationTerms nutationTerms(double T);

/**
 * Computes the local sidereal time.
 *
 * The mean sidereal time at 0h UT of JD is advanced by the Earth's rotation
 * over the fraction of the day (JT - JD). When nutation terms are supplied
 * the equation of the equinoxes is added, which turns mean into apparent
 * sidereal time.
 *
 * @param longitudeInDegrees Observer longitude, positive East (0 for Greenwich)
 * @param jd Julian Date at 0h UT
 * @param jt Julian Date including the fraction of the day
 * @param nutation Optional nutation terms
 * @return Sidereal time in degrees, normalized to [0, 360)
 */
double computeSiderealTime(double longitudeInDegrees, double jd, double jt,
                           const std::optional<NutationTerms> &nutation = std::nullopt);

/**
 * Normalizes an angle in degrees to [0, 360).
 */
double normalizeDegrees(double angle);

/**
 * Parses an ISO-8601 timestamp such as "2021-12-05T18:10:00.000" or
 * "2023-11-01T00:00:00Z". A space may be used instead of the 'T'.
 * @throws std::invalid_argument if the text is not a timestamp
 */
time_point parseInstant(std::string_view text);

/**
 * Formats an instant as "YYYY-MM-DDThh:mm:ss.sss".
 */
std::string formatInstant(time_point instant);

/**
 * Formats an instant as "YYYY-MM-DD hh:mm:ss UTC".
 */
std::string formatInstantUTC(time_point instant);

}

#endif
