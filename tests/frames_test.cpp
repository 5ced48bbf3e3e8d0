/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcore/frames.hpp>

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace orbitcore {
namespace {

using namespace std::chrono;

// ISS state vector in J2000 (m, m/s)
StateVector<Frame::J2000> issState() {
    return {
        .position = {-4228282.012, 4080666.827, -3421191.697},
        .velocity = {-1904.50887, -5821.53009, -4594.77013},
        .timestamp = sys_days{year{2021}/November/20} + hours{19} + minutes{28} + seconds{4}
    };
}

double relativeError(const Vec3 &actual, const Vec3 &expected) {
    return (actual - expected).magnitude() / expected.magnitude();
}

// ============================================================================
// Vec3 Tests
// ============================================================================

TEST(Vec3Test, Addition) {
    Vec3 a{1.0, 2.0, 3.0};
    Vec3 b{4.0, 5.0, 6.0};
    Vec3 result = a + b;
    EXPECT_DOUBLE_EQ(result.x, 5.0);
    EXPECT_DOUBLE_EQ(result.y, 7.0);
    EXPECT_DOUBLE_EQ(result.z, 9.0);
}

TEST(Vec3Test, CrossProduct) {
    Vec3 x{1.0, 0.0, 0.0};
    Vec3 y{0.0, 1.0, 0.0};
    Vec3 z = x.cross(y);
    EXPECT_DOUBLE_EQ(z.x, 0.0);
    EXPECT_DOUBLE_EQ(z.y, 0.0);
    EXPECT_DOUBLE_EQ(z.z, 1.0);
}

TEST(Vec3Test, Magnitude3D) {
    Vec3 v{2.0, 3.0, 6.0};
    EXPECT_DOUBLE_EQ(v.magnitude(), 7.0);
}

TEST(Vector3Test, FiniteCheck) {
    Vector3<Frame::J2000> finite{1.0, 2.0, 3.0};
    Vector3<Frame::J2000> notFinite{1.0, NAN, 3.0};
    EXPECT_TRUE(finite.isFinite());
    EXPECT_FALSE(notFinite.isFinite());
}

// ============================================================================
// Elementary Rotation Tests
// ============================================================================

TEST(RotationTest, QuarterTurnAboutZ) {
    Vec3 r = rotateZ({1.0, 0.0, 0.0}, 90.0);
    EXPECT_NEAR(r.x, 0.0, 1e-15);
    EXPECT_NEAR(r.y, 1.0, 1e-15);
    EXPECT_NEAR(r.z, 0.0, 1e-15);
}

TEST(RotationTest, QuarterTurnAboutX) {
    Vec3 r = rotateX({0.0, 1.0, 0.0}, 90.0);
    EXPECT_NEAR(r.y, 0.0, 1e-15);
    EXPECT_NEAR(r.z, 1.0, 1e-15);
}

TEST(RotationTest, QuarterTurnAboutY) {
    Vec3 r = rotateY({0.0, 0.0, 1.0}, 90.0);
    EXPECT_NEAR(r.x, 1.0, 1e-15);
    EXPECT_NEAR(r.z, 0.0, 1e-15);
}

// ============================================================================
// Frame Chain Tests
// ============================================================================

TEST(FrameTransformTest, NoPrecessionAtJ2000) {
    time_point epoch = sys_days{year{2000}/January/1} + hours{12};
    Vector3<Frame::J2000> r{7000000.0, -1000000.0, 250000.0};
    auto mod = posJ2000ToMOD(r, epoch);
    EXPECT_NEAR(mod.x, r.x, 1e-6);
    EXPECT_NEAR(mod.y, r.y, 1e-6);
    EXPECT_NEAR(mod.z, r.z, 1e-6);
}

TEST(FrameTransformTest, PrecessionRoundTrip) {
    auto osv = issState();
    auto back = posMODToJ2000(posJ2000ToMOD(osv.position, osv.timestamp), osv.timestamp);
    EXPECT_LT(relativeError(back.vec(), osv.position.vec()), 1e-12);
}

TEST(FrameTransformTest, CEPRoundTrip) {
    auto osv = issState();
    auto cep = posJ2000ToCEP(osv.position, osv.timestamp);
    auto back = posCEPToJ2000(cep, osv.timestamp);
    EXPECT_LT(relativeError(back.vec(), osv.position.vec()), 1e-12);
    EXPECT_NEAR(cep.magnitude(), osv.position.magnitude(), 1e-6);
}

TEST(FrameTransformTest, CEPToECEFIsRotationAboutZ) {
    auto osv = issState();
    auto cep = posJ2000ToCEP(osv.position, osv.timestamp);
    auto ecef = posCEPToECEF(cep, osv.timestamp);
    EXPECT_NEAR(ecef.z, cep.z, 1e-6);
    EXPECT_NEAR(ecef.magnitude(), cep.magnitude(), 1e-6);

    auto back = posECEFToCEP(ecef, osv.timestamp);
    EXPECT_LT(relativeError(back.vec(), cep.vec()), 1e-12);

    auto chained = posJ2000ToECEF(osv.position, osv.timestamp);
    EXPECT_LT(relativeError(chained.vec(), ecef.vec()), 1e-12);
}

TEST(FrameTransformTest, ECEFPositionRoundTrip) {
    auto osv = issState();
    auto ecef = posJ2000ToECEF(osv.position, osv.timestamp);
    auto back = posECEFToJ2000(ecef, osv.timestamp);
    EXPECT_LT(relativeError(back.vec(), osv.position.vec()), 1e-6);
}

TEST(FrameTransformTest, ECEFPositionRoundTripOverADay) {
    auto osv = issState();
    for (int hour = 0; hour < 24; hour += 3) {
        auto instant = osv.timestamp + hours{hour};
        auto back = posECEFToJ2000(posJ2000ToECEF(osv.position, instant), instant);
        EXPECT_LT(relativeError(back.vec(), osv.position.vec()), 1e-6) << "hour " << hour;
    }
}

TEST(FrameTransformTest, StateVectorECEFRoundTrip) {
    auto osv = issState();
    auto ecef = osvJ2000ToECEF(osv);
    auto back = osvECEFToJ2000(ecef);
    EXPECT_LT(relativeError(back.position.vec(), osv.position.vec()), 1e-6);
    EXPECT_LT(relativeError(back.velocity.vec(), osv.velocity.vec()), 1e-6);
    EXPECT_EQ(back.timestamp, osv.timestamp);
}

TEST(FrameTransformTest, ECEFPreservesRadius) {
    auto osv = issState();
    auto ecef = osvJ2000ToECEF(osv);
    EXPECT_NEAR(ecef.position.magnitude(), osv.position.magnitude(), 1e-6);
}

TEST(FrameTransformTest, EarthRotationInVelocity) {
    // A point fixed on the equator moves at about 465 m/s inertially
    StateVector<Frame::ECEF> fixed{
        .position = {WGS84_A, 0.0, 0.0},
        .velocity = {0.0, 0.0, 0.0},
        .timestamp = issState().timestamp
    };
    auto inertial = osvECEFToJ2000(fixed);
    EXPECT_NEAR(inertial.velocity.magnitude(), 465.1, 0.1);
}

TEST(FrameTransformTest, ExplicitNutationMatchesRecomputed) {
    auto osv = issState();
    auto julian = computeJulianTime(osv.timestamp);
    auto terms = nutationTerms(julianCenturies(julian.jt));
    auto withTerms = osvJ2000ToECEF(osv, terms);
    auto recomputed = osvJ2000ToECEF(osv);
    EXPECT_NEAR(withTerms.position.x, recomputed.position.x, 1e-6);
    EXPECT_NEAR(withTerms.position.y, recomputed.position.y, 1e-6);
    EXPECT_NEAR(withTerms.position.z, recomputed.position.z, 1e-6);
}

TEST(FrameTransformTest, TEMEIsCloseToJ2000) {
    auto osv = issState();
    StateVector<Frame::TEME> teme{
        .position = Vector3<Frame::TEME>::from(osv.position.vec()),
        .velocity = Vector3<Frame::TEME>::from(osv.velocity.vec()),
        .timestamp = osv.timestamp
    };
    auto j2000 = osvTEMEToJ2000(teme);
    EXPECT_NEAR(j2000.position.magnitude(), osv.position.magnitude(), 1e-6);
    // Two decades of precession is well under one degree
    EXPECT_LT(relativeError(j2000.position.vec(), osv.position.vec()), 0.01);
    EXPECT_GT(relativeError(j2000.position.vec(), osv.position.vec()), 0.0);
}

// ============================================================================
// WGS84 Tests
// ============================================================================

TEST(WGS84Test, EquatorPrimeMeridian) {
    auto r = wgs84ToCart(0.0, 0.0, 0.0);
    EXPECT_NEAR(r.x, WGS84_A, 1e-6);
    EXPECT_NEAR(r.y, 0.0, 1e-6);
    EXPECT_NEAR(r.z, 0.0, 1e-6);

    auto geo = cartToWgs84(r);
    EXPECT_NEAR(geo.latInDegrees, 0.0, 1e-9);
    EXPECT_NEAR(geo.lonInDegrees, 0.0, 1e-9);
    EXPECT_NEAR(geo.altInMeters, 0.0, 1e-3);
}

TEST(WGS84Test, NorthPole) {
    auto geo = cartToWgs84({0.0, 0.0, WGS84_B + 1000.0});
    EXPECT_NEAR(geo.latInDegrees, 90.0, 1e-9);
    EXPECT_NEAR(geo.altInMeters, 1000.0, 1e-3);
}

TEST(WGS84Test, RoundTripMultipleLocations) {
    struct Location { double lat, lon, alt; };
    const Location locations[] = {
        {45.0, -120.0, 400000.0},
        {-33.9, 151.2, 0.0},
        {78.2, 15.6, 500.0},
        {-60.0, -179.5, 35786000.0},
    };
    for (const auto &loc : locations) {
        auto geo = cartToWgs84(wgs84ToCart(loc.lat, loc.lon, loc.alt));
        EXPECT_NEAR(geo.latInDegrees, loc.lat, 1e-7);
        EXPECT_NEAR(geo.lonInDegrees, loc.lon, 1e-9);
        EXPECT_NEAR(geo.altInMeters, loc.alt, 1e-2);
    }
}

TEST(WGS84Test, GeodeticToECEF) {
    Geodetic geo{0.0, 90.0, 1000.0};
    auto r = geo.toECEF();
    EXPECT_NEAR(r.x, 0.0, 1e-6);
    EXPECT_NEAR(r.y, WGS84_A + 1000.0, 1e-6);
}

TEST(WGS84Test, ISSAltitude) {
    auto ecef = osvJ2000ToECEF(issState());
    auto geo = cartToWgs84(ecef.position);
    EXPECT_GT(geo.altInMeters, 380000.0);
    EXPECT_LT(geo.altInMeters, 440000.0);
    EXPECT_GE(geo.lonInDegrees, -180.0);
    EXPECT_LE(geo.lonInDegrees, 180.0);
}

// ============================================================================
// Display Frame Tests
// ============================================================================

TEST(DisplayFrameTest, Parse) {
    EXPECT_EQ(parseDisplayFrame("J2000"), DisplayFrame::Inertial);
    EXPECT_EQ(parseDisplayFrame("inertial"), DisplayFrame::Inertial);
    EXPECT_EQ(parseDisplayFrame("ECEF"), DisplayFrame::EarthFixed);
    EXPECT_EQ(parseDisplayFrame("earth-fixed"), DisplayFrame::EarthFixed);
    EXPECT_THROW(parseDisplayFrame("galactic"), std::invalid_argument);
}

TEST(DisplayFrameTest, Print) {
    std::ostringstream os;
    os << DisplayFrame::Inertial << " " << DisplayFrame::EarthFixed << " " << Frame::TEME;
    EXPECT_EQ(os.str(), "J2000 ECEF TEME");
}

}
}
