/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_KEPLER_HPP
#define __ORBITCORE_KEPLER_HPP

#include <orbitcore/frames.hpp>
#include <orbitcore/time_system.hpp>

#include <optional>
#include <ostream>

namespace orbitcore {

constexpr double EARTH_MU = 3.986004418e14;                 // Earth gravitational parameter (m^3/s^2)
constexpr double MIN_INCLINATION_IN_DEGREES = 1e-7;         // Below this the orbit is treated as equatorial

// Solver settings used by propagate()
constexpr double PROPAGATION_TOLERANCE = 1e-5;
constexpr int PROPAGATION_MAX_ITERATIONS = 10;

/**
 * Classical (osculating) Keplerian elements of an elliptical orbit.
 */
struct KeplerianElements {
    double semiMajorAxis = 0.0;             ///< a, meters
    double eccentricity = 0.0;              ///< e, 0 <= e < 1
    double inclination = 0.0;               ///< i, degrees
    double rightAscensionOfNode = 0.0;      ///< Ω, degrees
    double argumentOfPeriapsis = 0.0;       ///< ω, degrees
    double meanAnomaly = 0.0;               ///< M, degrees at the epoch
    double mu = EARTH_MU;                   ///< Gravitational parameter, m^3/s^2
    time_point epoch;                       ///< Instant the elements describe

    /**
     * Semi-minor axis b = a sqrt(1 - e²), meters.
     */
    double semiMinorAxis() const;
};

std::ostream& operator<<(std::ostream &os, const KeplerianElements &elements);

/**
 * Orbital period from Kepler's third law, 2π sqrt(a³/μ).
 * @return Period in seconds
 */
double computePeriod(double semiMajorAxis, double mu = EARTH_MU);

/**
 * Solves Kepler's equation E - e sin(E) = M by Newton-Raphson iteration,
 * starting from E = M.
 *
 * @param meanAnomalyInDegrees Mean anomaly M
 * @param eccentricity Orbit eccentricity
 * @param tolerance Convergence threshold on the residual |E - e sin(E) - M| (radians)
 * @param maxIterations Maximum number of Newton steps
 * @return Eccentric anomaly in degrees, or std::nullopt if the iteration did
 *         not converge within maxIterations
 */
std::optional<double> solveEccentricAnomaly(double meanAnomalyInDegrees, double eccentricity,
                                            double tolerance, int maxIterations);

/**
 * Computes osculating Keplerian elements from an inertial position and velocity.
 *
 * When the inclination is below MIN_INCLINATION_IN_DEGREES the node is
 * undefined and the argument of periapsis is measured from the X axis
 * instead of from the node.
 *
 * @param position Position (m)
 * @param velocity Velocity (m/s)
 * @param epoch Instant of the state
 */
KeplerianElements osvToKepler(const Vector3<Frame::J2000> &position,
                              const Vector3<Frame::J2000> &velocity,
                              time_point epoch);

KeplerianElements osvToKepler(const StateVector<Frame::J2000> &osv);

/**
 * Propagates Keplerian elements to an instant, before or after the epoch.
 *
 * @return The J2000 state at the instant, or std::nullopt when the elements
 *         have a zero semi-major axis or Kepler's equation does not converge
 */
std::optional<StateVector<Frame::J2000>> propagate(const KeplerianElements &elements, time_point instant);

}

#endif
