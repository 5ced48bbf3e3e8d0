/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/time_system.hpp>

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include <date/date.h>

namespace orbitcore {

// Julian Date and Julian Time from the calendar fields of an instant (Meeus, ch. 7)
JulianTime computeJulianTime(time_point instant) {
    using namespace std::chrono;

    auto dayPoint = floor<days>(instant);
    year_month_day ymd{dayPoint};

    int year = static_cast<int>(ymd.year());
    int month = static_cast<int>(static_cast<unsigned>(ymd.month()));
    int day = static_cast<int>(static_cast<unsigned>(ymd.day()));
    double hours = duration_cast<duration<double, std::ratio<3600>>>(instant - dayPoint).count();

    if (month <= 2) {
        year -= 1;
        month += 12;
    }

    double A = std::floor(year / 100.0);
    double B = 2.0 - A + std::floor(A / 4.0);

    double jd = std::floor(365.25 * (year + 4716))
              + std::floor(30.6001 * (month + 1))
              + day + B - 1524.5;

    return {jd, jd + hours / 24.0};
}

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

time_point fromJulianDate(double julianDate) {
    using namespace std::chrono;

    duration<double, days::period> sinceEpoch{julianDate - UNIX_EPOCH_JD};
    return time_point{round<microseconds>(sinceEpoch)};
}

double julianCenturies(double julianTime) {
    return (julianTime - J2000_JD) / DAYS_PER_JULIAN_CENTURY;
}

// Inverse of the Meeus algorithm, truncated to the calendar day
time_point julianToGregorian(double julianDate) {
    using namespace std::chrono;

    double Z = std::floor(julianDate + 0.5);
    double F = julianDate + 0.5 - Z;

    double A = Z;
    if (Z >= 2299161) {
        double alpha = std::floor((Z - 1867216.25) / 36524.25);
        A += 1 + alpha - std::floor(alpha / 4.0);
    }

    double B = A + 1524;
    double C = std::floor((B - 122.1) / 365.25);
    double D = std::floor(365.25 * C);
    double E = std::floor((B - D) / 30.6001);

    int d = static_cast<int>(std::floor(B - D - std::floor(30.6001 * E) + F));
    int m = static_cast<int>(E < 14 ? E - 1 : E - 13);
    int y = static_cast<int>(m > 2 ? C - 4716 : C - 4715);

    return sys_days{std::chrono::year{y} / m / d};
}

double meanObliquity(double T) {
    double T2 = T * T;
    double T3 = T2 * T;
    double arcseconds = 84381.406
                      - 46.836769 * T
                      - 0.0001831 * T2
                      + 0.0020034 * T3
                      - 0.000000576 * T3 * T
                      - 0.0000000434 * T3 * T2;
    return arcseconds * ARCSECONDS_TO_DEGREES;
}

// Two-term nutation series; the series coefficients are in arcseconds
NutationTerms nutationTerms(double T) {
    double ascendingNodeOfMoon = (125.04 - 1934.136 * T) * DEGREES_TO_RADIANS;
    double longitudeOfSun = (200.9 * T) * DEGREES_TO_RADIANS;

    double dpsi = -17.2 * std::sin(ascendingNodeOfMoon) - 1.32 * std::sin(longitudeOfSun);
    double deps = 9.2 * std::cos(ascendingNodeOfMoon) + 0.57 * std::cos(longitudeOfSun);

    return {
        .dpsi = dpsi * ARCSECONDS_TO_DEGREES,
        .deps = deps * ARCSECONDS_TO_DEGREES,
        .eps = meanObliquity(T)
    };
}

double normalizeDegrees(double angle) {
    angle = std::fmod(angle, 360.0);
    if (angle < 0) angle += 360.0;
    return angle;
}

double computeSiderealTime(double longitudeInDegrees, double jd, double jt,
                           const std::optional<NutationTerms> &nutation) {
    // Julian centuries since J2000.0 at 0h UT
    double T = julianCenturies(jd);

    // GMST in degrees at 0h UT, then add rotation for time of day
    double siderealTime = GMST_AT_J2000
                        + EARTH_SIDEREAL_RATE * (jd - J2000_JD)
                        + GMST_T2_COEFF * T * T
                        - T * T * T / GMST_T3_DIVISOR
                        + EARTH_SIDEREAL_RATE * (jt - jd);

    // Equation of the equinoxes
    if (nutation) {
        siderealTime += nutation->dpsi * std::cos(nutation->eps * DEGREES_TO_RADIANS);
    }

    return normalizeDegrees(siderealTime + longitudeInDegrees);
}

time_point parseInstant(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    auto last = text.find_last_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        throw std::invalid_argument("Empty timestamp");
    }

    std::string value(text.substr(first, last - first + 1));
    if (value.size() > 10 && value[10] == ' ') {
        value[10] = 'T';
    }

    std::istringstream in(value);
    date::sys_time<std::chrono::microseconds> parsed;
    in >> date::parse("%FT%T", parsed);
    if (in.fail()) {
        throw std::invalid_argument("Invalid timestamp: " + value);
    }

    return std::chrono::time_point_cast<time_point::duration>(parsed);
}

std::string formatInstant(time_point instant) {
    return date::format("%FT%T", std::chrono::floor<std::chrono::milliseconds>(instant));
}

std::string formatInstantUTC(time_point instant) {
    return date::format("%F %T UTC", std::chrono::floor<std::chrono::seconds>(instant));
}

}
