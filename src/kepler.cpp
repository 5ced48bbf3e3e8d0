/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/kepler.hpp>

#include <chrono>
#include <cmath>
#include <numbers>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace orbitcore {

double KeplerianElements::semiMinorAxis() const {
    return semiMajorAxis * std::sqrt(1.0 - eccentricity * eccentricity);
}

std::ostream& operator<<(std::ostream &os, const KeplerianElements &elements) {
    os << "  Epoch: " << formatInstantUTC(elements.epoch) << std::endl;
    os << "  Semi-major Axis: " << elements.semiMajorAxis / 1000.0 << " km" << std::endl;
    os << "  Eccentricity: " << elements.eccentricity << std::endl;
    os << "  Inclination: " << elements.inclination << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << elements.rightAscensionOfNode << " deg" << std::endl;
    os << "  Argument of Periapsis: " << elements.argumentOfPeriapsis << " deg" << std::endl;
    os << "  Mean Anomaly: " << elements.meanAnomaly << " deg" << std::endl;
    os << "  Period: " << computePeriod(elements.semiMajorAxis, elements.mu) / 60.0 << " min" << std::endl;
    return os;
}

double computePeriod(double semiMajorAxis, double mu) {
    return 2.0 * std::numbers::pi * std::sqrt(semiMajorAxis * semiMajorAxis * semiMajorAxis / mu);
}

std::optional<double> solveEccentricAnomaly(double meanAnomalyInDegrees, double eccentricity,
                                            double tolerance, int maxIterations) {
    double M = meanAnomalyInDegrees * DEGREES_TO_RADIANS;
    double E = M;
    double error = tolerance + 1.0;
    int iterations = 0;

    while (error > tolerance) {
        if (++iterations > maxIterations) {
            return std::nullopt;
        }
        E -= (E - eccentricity * std::sin(E) - M) / (1.0 - eccentricity * std::cos(E));
        error = std::abs(E - eccentricity * std::sin(E) - M);
    }

    if (!std::isfinite(E)) {
        return std::nullopt;
    }
    return E * RADIANS_TO_DEGREES;
}

KeplerianElements osvToKepler(const Vector3<Frame::J2000> &position,
                              const Vector3<Frame::J2000> &velocity,
                              time_point epoch) {
    KeplerianElements elements;
    elements.epoch = epoch;
    elements.mu = EARTH_MU;

    Vec3 r = position.vec();
    Vec3 v = velocity.vec();
    double rNorm = r.magnitude();

    // Specific angular momentum and eccentricity vector
    Vec3 k = r.cross(v);
    Vec3 ecc = v.cross(k) * (1.0 / elements.mu) - r * (1.0 / rNorm);
    elements.eccentricity = ecc.magnitude();

    elements.inclination = std::acos(k.z / k.magnitude()) * RADIANS_TO_DEGREES;

    // Energy integral gives the semi-major axis
    double energy = 0.5 * v.dot(v) - elements.mu / rNorm;
    elements.semiMajorAxis = -elements.mu / (2.0 * energy);

    elements.rightAscensionOfNode = std::atan2(k.x, -k.y) * RADIANS_TO_DEGREES;

    if (elements.inclination < MIN_INCLINATION_IN_DEGREES) {
        // The node is undefined; measure the periapsis from the X axis
        elements.argumentOfPeriapsis = std::atan2(ecc.y, ecc.x) * RADIANS_TO_DEGREES
                                     - elements.rightAscensionOfNode;
    } else {
        double raan = elements.rightAscensionOfNode * DEGREES_TO_RADIANS;
        double sinIncl = std::sin(elements.inclination * DEGREES_TO_RADIANS);
        double ascY = ecc.z / sinIncl;
        double ascX = ecc.x * std::cos(raan) + ecc.y * std::sin(raan);
        elements.argumentOfPeriapsis = std::atan2(ascY, ascX) * RADIANS_TO_DEGREES;
    }

    // Express the position in the perifocal frame to read off the eccentric anomaly
    Vec3 perifocal = rotateZ(rotateX(rotateZ(r, -elements.rightAscensionOfNode),
                                     -elements.inclination),
                             -elements.argumentOfPeriapsis);
    double a = elements.semiMajorAxis;
    double b = elements.semiMinorAxis();
    double E = std::atan2(perifocal.y / b, perifocal.x / a + elements.eccentricity);
    double M = E - elements.eccentricity * std::sin(E);
    elements.meanAnomaly = normalizeDegrees(M * RADIANS_TO_DEGREES);

    return elements;
}

KeplerianElements osvToKepler(const StateVector<Frame::J2000> &osv) {
    return osvToKepler(osv.position, osv.velocity, osv.timestamp);
}

std::optional<StateVector<Frame::J2000>> propagate(const KeplerianElements &elements, time_point instant) {
    using namespace std::chrono;

    if (elements.semiMajorAxis == 0.0) {
        return std::nullopt;
    }
    if (elements.semiMajorAxis < 0.0 || elements.eccentricity >= 1.0) {
        debug("Cannot propagate non-elliptical orbit (a = {}, e = {})",
              elements.semiMajorAxis, elements.eccentricity);
        return std::nullopt;
    }

    double period = computePeriod(elements.semiMajorAxis, elements.mu);
    double elapsed = duration_cast<duration<double>>(instant - elements.epoch).count();
    double M = normalizeDegrees(elements.meanAnomaly + 360.0 * elapsed / period);

    auto eccentricAnomaly = solveEccentricAnomaly(M, elements.eccentricity,
                                                  PROPAGATION_TOLERANCE, PROPAGATION_MAX_ITERATIONS);
    if (!eccentricAnomaly) {
        debug("Kepler's equation did not converge (M = {}, e = {})", M, elements.eccentricity);
        return std::nullopt;
    }

    double E = *eccentricAnomaly * DEGREES_TO_RADIANS;
    double a = elements.semiMajorAxis;
    double b = elements.semiMinorAxis();
    double e = elements.eccentricity;

    double meanMotion = 2.0 * std::numbers::pi / period;
    double eDot = meanMotion / (1.0 - e * std::cos(E));

    Vec3 rOrbital{a * (std::cos(E) - e), b * std::sin(E), 0.0};
    Vec3 vOrbital{-a * std::sin(E) * eDot, b * std::cos(E) * eDot, 0.0};

    auto toInertial = [&elements](const Vec3 &v) {
        return Vector3<Frame::J2000>::from(
            rotateZ(rotateX(rotateZ(v, elements.argumentOfPeriapsis), elements.inclination),
                    elements.rightAscensionOfNode));
    };

    return StateVector<Frame::J2000>{
        .position = toInertial(rOrbital),
        .velocity = toInertial(vOrbital),
        .timestamp = instant
    };
}

}
