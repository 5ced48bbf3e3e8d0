/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 Satellite Propagation Module
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#ifndef __ORBITCORE_SGP4_HPP
#define __ORBITCORE_SGP4_HPP

#include <cmath>
#include <stdexcept>
#include <string>

namespace orbitcore::sgp4 {

// ============================================================================
// SGP4 Constants
// ============================================================================

// WGS-72 Constants (the gravity model TLEs are generated with)
constexpr double MU = 398600.8;                    // Earth gravitational parameter (km^3/s^2)
constexpr double RADIUS_EARTH_KM = 6378.135;       // Earth equatorial radius (km)
constexpr double J2 = 0.001082616;                 // Second gravitational zonal harmonic
constexpr double J3 = -0.00000253881;              // Third gravitational zonal harmonic
constexpr double J4 = -0.00000165597;              // Fourth gravitational zonal harmonic
constexpr double J3OJ2 = J3 / J2;
constexpr double XKE = 0.0743669161331734132;      // sqrt(GM) in Earth radii^1.5/min
constexpr double VKMPERSEC = RADIUS_EARTH_KM * XKE / 60.0;  // km/s per velocity unit
constexpr double TWO_PI = 2.0 * M_PI;
constexpr double X2O3 = 2.0 / 3.0;

// Orbits with a period at or above this many minutes are deep-space orbits
constexpr double DEEP_SPACE_PERIOD_MINUTES = 225.0;

// Earth rotation rate (rad/min)
constexpr double EARTH_ROTATION_RAD_PER_MIN = 4.37526908801129966e-3;

// ============================================================================
// SGP4 Exception Classes
// ============================================================================

/**
 * Base exception class for SGP4 propagation errors.
 */
class SGP4Exception : public std::runtime_error {
public:
    explicit SGP4Exception(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a satellite has decayed (re-entered atmosphere).
 */
class SatelliteDecayedException : public SGP4Exception {
public:
    SatelliteDecayedException() : SGP4Exception("Satellite has decayed") {}
};

/**
 * Exception thrown when orbital elements are invalid.
 */
class InvalidOrbitException : public SGP4Exception {
public:
    explicit InvalidOrbitException(const std::string& msg) : SGP4Exception(msg) {}
};

// ============================================================================
// SGP4 Data Structures
// ============================================================================

/**
 * Mean elements from a TLE, in the units SGP4 works with.
 */
struct Elements {
    double epoch_jd;           // Epoch as Julian Date
    double bstar;              // BSTAR drag term
    double inclination;        // Inclination (radians)
    double raan;               // Right ascension of ascending node (radians)
    double eccentricity;       // Eccentricity
    double arg_perigee;        // Argument of perigee (radians)
    double mean_anomaly;       // Mean anomaly (radians)
    double mean_motion;        // Mean motion (rad/min)
};

/**
 * Precomputed SGP4/SDP4 coefficients for one element set.
 */
struct State {
    bool initialized = false;
    bool deepSpace = false;       // Period >= 225 minutes (SDP4)
    bool isimp = false;           // Deep space, or perigee below 220 km: truncated drag terms
    int irez = 0;                 // Resonance: 0 none, 1 one day, 2 half day

    double epoch_jd = 0.0;
    double gsto = 0.0;            // Greenwich sidereal time at epoch (rad)

    // Mean elements at epoch
    double ecco = 0.0;
    double inclo = 0.0;
    double nodeo = 0.0;
    double argpo = 0.0;
    double mo = 0.0;
    double bstar = 0.0;
    double no_unkozai = 0.0;      // Brouwer mean motion (rad/min)
    double a = 0.0;               // Semi-major axis (Earth radii)

    // Secular rates
    double mdot = 0.0;
    double argpdot = 0.0;
    double nodedot = 0.0;
    double nodecf = 0.0;

    // Drag coefficients
    double cc1 = 0.0, cc4 = 0.0, cc5 = 0.0;
    double d2 = 0.0, d3 = 0.0, d4 = 0.0;
    double t2cof = 0.0, t3cof = 0.0, t4cof = 0.0, t5cof = 0.0;
    double omgcof = 0.0;
    double xmcof = 0.0;
    double eta = 0.0;
    double delmo = 0.0;
    double sinmao = 0.0;

    // Long and short period coefficients
    double aycof = 0.0;
    double xlcof = 0.0;
    double con41 = 0.0;
    double x1mth2 = 0.0;
    double x7thm1 = 0.0;

    // Lunar-solar periodic coefficients
    double e3 = 0.0, ee2 = 0.0;
    double se2 = 0.0, se3 = 0.0;
    double sgh2 = 0.0, sgh3 = 0.0, sgh4 = 0.0;
    double sh2 = 0.0, sh3 = 0.0;
    double si2 = 0.0, si3 = 0.0;
    double sl2 = 0.0, sl3 = 0.0, sl4 = 0.0;
    double xgh2 = 0.0, xgh3 = 0.0, xgh4 = 0.0;
    double xh2 = 0.0, xh3 = 0.0;
    double xi2 = 0.0, xi3 = 0.0;
    double xl2 = 0.0, xl3 = 0.0, xl4 = 0.0;
    double zmol = 0.0, zmos = 0.0;

    // Lunar-solar secular rates
    double dedt = 0.0, didt = 0.0, dmdt = 0.0, dnodt = 0.0, domdt = 0.0;

    // Geopotential resonance coefficients
    double d2201 = 0.0, d2211 = 0.0;
    double d3210 = 0.0, d3222 = 0.0;
    double d4410 = 0.0, d4422 = 0.0;
    double d5220 = 0.0, d5232 = 0.0, d5421 = 0.0, d5433 = 0.0;
    double del1 = 0.0, del2 = 0.0, del3 = 0.0;
    double xfact = 0.0;
    double xlamo = 0.0;
};

/**
 * Output from SGP4 propagation.
 */
struct Result {
    double r[3];  // Position (km) in TEME frame
    double v[3];  // Velocity (km/s) in TEME frame
};

// ============================================================================
// SGP4 Public API
// ============================================================================

/**
 * Initialize SGP4 state from orbital elements.
 * Must be called before propagate().
 *
 * Orbits with a period of 225 minutes or more also get the SDP4 lunar-solar
 * and geopotential resonance terms.
 *
 * @param state Output state structure to initialize
 * @param elements Input orbital elements from TLE
 * @throws InvalidOrbitException if elements are invalid
 * @throws SatelliteDecayedException if satellite has decayed
 */
void initialize(State& state, const Elements& elements);

/**
 * Propagate to time since epoch.
 *
 * @param state The initialized SGP4 state (from initialize())
 * @param tsince Minutes since epoch
 * @return Result containing position and velocity in TEME
 * @throws InvalidOrbitException if propagation fails
 * @throws SatelliteDecayedException if satellite has decayed
 */
Result propagate(const State& state, double tsince);

// ============================================================================
// Deep Space Functions
// ============================================================================

/**
 * Computes the lunar-solar and resonance coefficients of a deep-space
 * element set. Called by initialize() once the near-earth terms are set.
 */
void initializeDeepSpace(State& state);

/**
 * Applies the lunar-solar secular rates and integrates the resonance terms
 * from the epoch to t. The mean elements are updated in place.
 *
 * @param state The SGP4 state
 * @param t Minutes since epoch
 */
void deepSpaceSecular(const State& state, double t,
                      double& em, double& argpm, double& inclm,
                      double& nodem, double& mm, double& nm);

/**
 * Applies the lunar-solar periodics at t, with the Lyddane modification
 * below 0.2 rad of inclination.
 */
void deepSpacePeriodic(const State& state, double t,
                       double& ep, double& inclp, double& nodep,
                       double& argpp, double& mp);

/**
 * Greenwich mean sidereal time (IAU-82) in radians for a UT1 Julian Date.
 */
double gstime(double jdut1);

} // namespace orbitcore::sgp4

#endif // __ORBITCORE_SGP4_HPP
