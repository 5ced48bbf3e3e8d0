/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/sun_moon.hpp>
#include <orbitcore/kepler.hpp>

#include <cmath>
#include <stdexcept>

namespace orbitcore {

namespace {

constexpr double ARCSECONDS_PER_RADIAN = 3600.0 * 180.0 / M_PI;
constexpr double KILOMETERS = 1000.0;

double frac(double x) {
    return x - std::floor(x);
}

// Right ascension and declination on the true equator of date
CelestialPosition describe(const Vector3<Frame::J2000> &position, time_point instant,
                           const std::optional<NutationTerms> &nutation) {
    NutationTerms n = resolveNutation(nutation, instant);
    auto cep = posJ2000ToCEP(position, instant, n);
    auto ecef = posCEPToECEF(cep, instant, n);

    CelestialPosition result{};
    result.position = position;
    result.rightAscension = normalizeDegrees(std::atan2(cep.y, cep.x) * RADIANS_TO_DEGREES);
    result.declination = std::atan2(cep.z, std::hypot(cep.x, cep.y)) * RADIANS_TO_DEGREES;
    result.subPoint = cartToWgs84(ecef);
    return result;
}

}

Vector3<Frame::J2000> sunPositionJ2000(time_point instant) {
    double T = julianCenturies(computeJulianTime(instant).jt);

    // Earth-Moon barycentre, J2000 ecliptic and equinox
    double a = 1.00000261 + 0.00000562 * T;
    double e = 0.01671123 - 0.00004392 * T;
    double i = -0.00001531 - 0.01294668 * T;
    double L = 100.46457166 + 35999.37244981 * T;
    double longitudeOfPerihelion = 102.93768193 + 0.32327364 * T;
    double node = 0.0;

    double M = normalizeDegrees(L - longitudeOfPerihelion);
    double argumentOfPerihelion = longitudeOfPerihelion - node;

    auto E = solveEccentricAnomaly(M, e, 1e-12, 20);
    if (!E) {
        throw std::runtime_error("Sun position: Kepler's equation did not converge");
    }
    double Erad = *E * DEGREES_TO_RADIANS;

    Vec3 inPlane{a * (std::cos(Erad) - e), a * std::sqrt(1.0 - e * e) * std::sin(Erad), 0.0};
    Vec3 heliocentric = rotateZ(rotateX(rotateZ(inPlane, argumentOfPerihelion), i), node);

    // The Sun is opposite the Earth
    Vec3 ecliptic = heliocentric * (-ASTRONOMICAL_UNIT);
    return Vector3<Frame::J2000>::from(rotateX(ecliptic, J2000_OBLIQUITY));
}

Vector3<Frame::J2000> moonPositionJ2000(time_point instant) {
    double T = julianCenturies(computeJulianTime(instant).jt);

    // Fundamental arguments (radians)
    double L0 = frac(0.606433 + 1336.855225 * T);
    double l = 2.0 * M_PI * frac(0.374897 + 1325.552410 * T);   // Moon mean anomaly
    double ls = 2.0 * M_PI * frac(0.993133 + 99.997361 * T);    // Sun mean anomaly
    double D = 2.0 * M_PI * frac(0.827361 + 1236.853086 * T);   // Elongation
    double F = 2.0 * M_PI * frac(0.259086 + 1342.227825 * T);   // Argument of latitude

    // Longitude perturbations (arcseconds)
    double dL = 22640.0 * std::sin(l) - 4586.0 * std::sin(l - 2.0 * D) + 2370.0 * std::sin(2.0 * D)
              + 769.0 * std::sin(2.0 * l) - 668.0 * std::sin(ls) - 412.0 * std::sin(2.0 * F)
              - 212.0 * std::sin(2.0 * l - 2.0 * D) - 206.0 * std::sin(l + ls - 2.0 * D)
              + 192.0 * std::sin(l + 2.0 * D) - 165.0 * std::sin(ls - 2.0 * D)
              - 125.0 * std::sin(D) - 110.0 * std::sin(l + ls) + 148.0 * std::sin(l - ls)
              - 55.0 * std::sin(2.0 * F - 2.0 * D);

    double S = F + (dL + 412.0 * std::sin(2.0 * F) + 541.0 * std::sin(ls)) / ARCSECONDS_PER_RADIAN;
    double h = F - 2.0 * D;
    double N = -526.0 * std::sin(h) + 44.0 * std::sin(l + h) - 31.0 * std::sin(-l + h)
             - 23.0 * std::sin(ls + h) + 11.0 * std::sin(-ls + h) - 25.0 * std::sin(-2.0 * l + F)
             + 21.0 * std::sin(-l + F);

    double longitude = 2.0 * M_PI * frac(L0 + dL / 1296.0e3);
    double latitude = (18520.0 * std::sin(S) + N) / ARCSECONDS_PER_RADIAN;

    // Distance (km)
    double distance = 385000.56 - 20905.355 * std::cos(l) - 3699.111 * std::cos(2.0 * D - l)
                    - 2955.968 * std::cos(2.0 * D) - 569.925 * std::cos(2.0 * l)
                    + 48.888 * std::cos(ls) - 3.149 * std::cos(2.0 * F)
                    + 246.158 * std::cos(2.0 * D - 2.0 * l) - 152.138 * std::cos(2.0 * D - ls - l)
                    - 170.733 * std::cos(2.0 * D + l) - 204.586 * std::cos(2.0 * D - ls)
                    - 129.620 * std::cos(ls - l) + 108.743 * std::cos(D) + 104.755 * std::cos(ls + l);

    // Mean ecliptic and equinox of date, then the mean equator of date
    double r = distance * KILOMETERS;
    Vec3 ecliptic{r * std::cos(latitude) * std::cos(longitude),
                  r * std::cos(latitude) * std::sin(longitude),
                  r * std::sin(latitude)};
    auto mod = Vector3<Frame::MOD>::from(rotateX(ecliptic, meanObliquity(T)));
    return posMODToJ2000(mod, instant);
}

CelestialPosition locateSun(time_point instant, const std::optional<NutationTerms> &nutation) {
    return describe(sunPositionJ2000(instant), instant, nutation);
}

CelestialPosition locateMoon(time_point instant, const std::optional<NutationTerms> &nutation) {
    return describe(moonPositionJ2000(instant), instant, nutation);
}

}
