/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/frames.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace orbitcore {

std::ostream& operator<<(std::ostream &os, const Frame &frame) {
    switch (frame) {
        case Frame::J2000:
            os << "J2000";
            break;
        case Frame::MOD:
            os << "MOD";
            break;
        case Frame::CEP:
            os << "CEP";
            break;
        case Frame::TEME:
            os << "TEME";
            break;
        case Frame::ECEF:
            os << "ECEF";
            break;
    }
    return os;
}

std::ostream& operator<<(std::ostream &os, const DisplayFrame &frame) {
    switch (frame) {
        case DisplayFrame::Inertial:
            os << "J2000";
            break;
        case DisplayFrame::EarthFixed:
            os << "ECEF";
            break;
    }
    return os;
}

DisplayFrame parseDisplayFrame(std::string_view name) {
    std::string value(name);
    std::ranges::transform(value, value.begin(), [](unsigned char c) { return std::tolower(c); });
    if (value == "j2000" || value == "inertial") {
        return DisplayFrame::Inertial;
    } else if (value == "ecef" || value == "earth-fixed" || value == "earthfixed") {
        return DisplayFrame::EarthFixed;
    }
    throw std::invalid_argument("Unknown display frame: " + std::string(name));
}

Vec3 rotateX(const Vec3 &v, double angleInDegrees) {
    double c = std::cos(angleInDegrees * DEGREES_TO_RADIANS);
    double s = std::sin(angleInDegrees * DEGREES_TO_RADIANS);
    return {v.x, c * v.y - s * v.z, s * v.y + c * v.z};
}

Vec3 rotateY(const Vec3 &v, double angleInDegrees) {
    double c = std::cos(angleInDegrees * DEGREES_TO_RADIANS);
    double s = std::sin(angleInDegrees * DEGREES_TO_RADIANS);
    return {c * v.x + s * v.z, v.y, -s * v.x + c * v.z};
}

Vec3 rotateZ(const Vec3 &v, double angleInDegrees) {
    double c = std::cos(angleInDegrees * DEGREES_TO_RADIANS);
    double s = std::sin(angleInDegrees * DEGREES_TO_RADIANS);
    return {c * v.x - s * v.y, s * v.x + c * v.y, v.z};
}

NutationTerms resolveNutation(const std::optional<NutationTerms> &nutation, time_point instant) {
    if (nutation) {
        return *nutation;
    }
    JulianTime julian = computeJulianTime(instant);
    return nutationTerms(julianCenturies(julian.jt));
}

double greenwichSiderealTime(time_point instant, const std::optional<NutationTerms> &nutation) {
    JulianTime julian = computeJulianTime(instant);
    return computeSiderealTime(0.0, julian.jd, julian.jt, resolveNutation(nutation, instant));
}

namespace {

// IAU 1976 precession angles (degrees)
struct PrecessionAngles {
    double z;
    double nu;
    double zeta;
};

PrecessionAngles precessionAngles(time_point instant) {
    double T = julianCenturies(computeJulianTime(instant).jt);
    double T2 = T * T;
    double T3 = T2 * T;
    return {
        .z = 0.6406161388 * T + 3.0407777777e-4 * T2 + 5.0563888888e-6 * T3,
        .nu = 0.5567530277 * T - 1.1851388888e-4 * T2 - 1.1620277777e-5 * T3,
        .zeta = 0.6406161388 * T + 8.3855555555e-5 * T2 + 4.9994444444e-6 * T3
    };
}

Vec3 precess(const Vec3 &r, const PrecessionAngles &p) {
    return rotateZ(rotateY(rotateZ(r, p.zeta), -p.nu), p.z);
}

Vec3 unprecess(const Vec3 &r, const PrecessionAngles &p) {
    return rotateZ(rotateY(rotateZ(r, -p.z), p.nu), -p.zeta);
}

Vec3 nutate(const Vec3 &r, const NutationTerms &n) {
    return rotateX(rotateZ(rotateX(r, -n.eps), n.dpsi), n.eps + n.deps);
}

Vec3 unnutate(const Vec3 &r, const NutationTerms &n) {
    return rotateX(rotateZ(rotateX(r, -(n.eps + n.deps)), -n.dpsi), n.eps);
}

// Time derivative of the sidereal rotation applied to a CEP position (m/s)
Vec3 earthRotationTerm(const Vec3 &rCEP, double siderealTimeInDegrees) {
    double theta = siderealTimeInDegrees * DEGREES_TO_RADIANS;
    double rate = EARTH_ROTATION_RATE * DEGREES_TO_RADIANS;
    double c = std::cos(theta);
    double s = std::sin(theta);
    return {
        rate * (-s * rCEP.x + c * rCEP.y),
        rate * (-c * rCEP.x - s * rCEP.y),
        0.0
    };
}

}

Vector3<Frame::MOD> posJ2000ToMOD(const Vector3<Frame::J2000> &r, time_point instant) {
    return Vector3<Frame::MOD>::from(precess(r.vec(), precessionAngles(instant)));
}

Vector3<Frame::J2000> posMODToJ2000(const Vector3<Frame::MOD> &r, time_point instant) {
    return Vector3<Frame::J2000>::from(unprecess(r.vec(), precessionAngles(instant)));
}

Vector3<Frame::CEP> posJ2000ToCEP(const Vector3<Frame::J2000> &r, time_point instant,
                                  const std::optional<NutationTerms> &nutation) {
    Vec3 mod = precess(r.vec(), precessionAngles(instant));
    return Vector3<Frame::CEP>::from(nutate(mod, resolveNutation(nutation, instant)));
}

Vector3<Frame::J2000> posCEPToJ2000(const Vector3<Frame::CEP> &r, time_point instant,
                                    const std::optional<NutationTerms> &nutation) {
    Vec3 mod = unnutate(r.vec(), resolveNutation(nutation, instant));
    return Vector3<Frame::J2000>::from(unprecess(mod, precessionAngles(instant)));
}

Vector3<Frame::ECEF> posCEPToECEF(const Vector3<Frame::CEP> &r, time_point instant,
                                  const std::optional<NutationTerms> &nutation) {
    double lst = greenwichSiderealTime(instant, nutation);
    return Vector3<Frame::ECEF>::from(rotateZ(r.vec(), -lst));
}

Vector3<Frame::CEP> posECEFToCEP(const Vector3<Frame::ECEF> &r, time_point instant,
                                 const std::optional<NutationTerms> &nutation) {
    double lst = greenwichSiderealTime(instant, nutation);
    return Vector3<Frame::CEP>::from(rotateZ(r.vec(), lst));
}

Vector3<Frame::ECEF> posJ2000ToECEF(const Vector3<Frame::J2000> &r, time_point instant,
                                    const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, instant);
    return posCEPToECEF(posJ2000ToCEP(r, instant, n), instant, n);
}

Vector3<Frame::J2000> posECEFToJ2000(const Vector3<Frame::ECEF> &r, time_point instant,
                                     const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, instant);
    return posCEPToJ2000(posECEFToCEP(r, instant, n), instant, n);
}

StateVector<Frame::CEP> osvJ2000ToCEP(const StateVector<Frame::J2000> &osv,
                                      const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, osv.timestamp);
    PrecessionAngles p = precessionAngles(osv.timestamp);
    return {
        .position = Vector3<Frame::CEP>::from(nutate(precess(osv.position.vec(), p), n)),
        .velocity = Vector3<Frame::CEP>::from(nutate(precess(osv.velocity.vec(), p), n)),
        .timestamp = osv.timestamp
    };
}

StateVector<Frame::J2000> osvCEPToJ2000(const StateVector<Frame::CEP> &osv,
                                        const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, osv.timestamp);
    PrecessionAngles p = precessionAngles(osv.timestamp);
    return {
        .position = Vector3<Frame::J2000>::from(unprecess(unnutate(osv.position.vec(), n), p)),
        .velocity = Vector3<Frame::J2000>::from(unprecess(unnutate(osv.velocity.vec(), n), p)),
        .timestamp = osv.timestamp
    };
}

StateVector<Frame::ECEF> osvJ2000ToECEF(const StateVector<Frame::J2000> &osv,
                                        const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, osv.timestamp);
    StateVector<Frame::CEP> cep = osvJ2000ToCEP(osv, n);
    double lst = greenwichSiderealTime(osv.timestamp, n);

    Vec3 r = rotateZ(cep.position.vec(), -lst);
    Vec3 v = rotateZ(cep.velocity.vec(), -lst) + earthRotationTerm(cep.position.vec(), lst);

    return {
        .position = Vector3<Frame::ECEF>::from(r),
        .velocity = Vector3<Frame::ECEF>::from(v),
        .timestamp = osv.timestamp
    };
}

StateVector<Frame::J2000> osvECEFToJ2000(const StateVector<Frame::ECEF> &osv,
                                         const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, osv.timestamp);
    double lst = greenwichSiderealTime(osv.timestamp, n);

    Vec3 rCEP = rotateZ(osv.position.vec(), lst);
    Vec3 vCEP = rotateZ(osv.velocity.vec() - earthRotationTerm(rCEP, lst), lst);

    StateVector<Frame::CEP> cep{
        .position = Vector3<Frame::CEP>::from(rCEP),
        .velocity = Vector3<Frame::CEP>::from(vCEP),
        .timestamp = osv.timestamp
    };
    return osvCEPToJ2000(cep, n);
}

StateVector<Frame::J2000> osvTEMEToJ2000(const StateVector<Frame::TEME> &osv,
                                         const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, osv.timestamp);
    double equationOfEquinoxes = n.dpsi * std::cos(n.eps * DEGREES_TO_RADIANS);

    StateVector<Frame::CEP> cep{
        .position = Vector3<Frame::CEP>::from(rotateZ(osv.position.vec(), equationOfEquinoxes)),
        .velocity = Vector3<Frame::CEP>::from(rotateZ(osv.velocity.vec(), equationOfEquinoxes)),
        .timestamp = osv.timestamp
    };
    return osvCEPToJ2000(cep, n);
}

// Convert ECEF coordinates to geodetic latitude, longitude, and altitude
Geodetic cartToWgs84(const Vector3<Frame::ECEF> &r) {
    double lon = std::atan2(r.y, r.x);
    double p = std::sqrt(r.x * r.x + r.y * r.y);

    double lat = std::atan2(r.z, (1.0 - WGS84_E2) * p);  // initial guess
    double alt = 0.0;

    for (int i = 0; i < WGS84_LATITUDE_ITERATIONS; ++i) {
        double sinLat = std::sin(lat);
        double cosLat = std::cos(lat);
        double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

        // p / cos(lat) is undefined on the polar axis
        if (std::abs(cosLat) > 1e-10) {
            alt = p / cosLat - N;
        } else {
            alt = std::abs(r.z) - N * (1.0 - WGS84_E2);
        }

        lat = std::atan2(r.z, (1.0 - WGS84_E2 * N / (N + alt)) * p);
    }

    return {lat * RADIANS_TO_DEGREES, lon * RADIANS_TO_DEGREES, alt};
}

Vector3<Frame::ECEF> wgs84ToCart(double latInDegrees, double lonInDegrees, double altInMeters) {
    double sinLat = std::sin(latInDegrees * DEGREES_TO_RADIANS);
    double cosLat = std::cos(latInDegrees * DEGREES_TO_RADIANS);
    double sinLon = std::sin(lonInDegrees * DEGREES_TO_RADIANS);
    double cosLon = std::cos(lonInDegrees * DEGREES_TO_RADIANS);

    // Radius of curvature in the prime vertical
    double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

    return {
        (N + altInMeters) * cosLat * cosLon,
        (N + altInMeters) * cosLat * sinLon,
        ((1.0 - WGS84_E2) * N + altInMeters) * sinLat
    };
}

Vector3<Frame::ECEF> Geodetic::toECEF() const {
    return wgs84ToCart(latInDegrees, lonInDegrees, altInMeters);
}

}
