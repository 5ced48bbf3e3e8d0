/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcore/sun_moon.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace orbitcore {
namespace {

using namespace std::chrono;

double separationInDegrees(const Vec3 &a, const Vec3 &b) {
    double c = a.dot(b) / (a.magnitude() * b.magnitude());
    return std::acos(std::clamp(c, -1.0, 1.0)) * RADIANS_TO_DEGREES;
}

// ============================================================================
// Sun Tests
// ============================================================================

TEST(SunTest, JuneSolsticeDeclination) {
    time_point solstice = sys_days{year{2021}/June/21} + hours{3} + minutes{32};
    auto sun = locateSun(solstice);
    EXPECT_NEAR(sun.declination, 23.44, 0.05);
    EXPECT_NEAR(sun.rightAscension, 90.0, 0.1);
}

TEST(SunTest, MarchEquinoxOnEquator) {
    time_point equinox = sys_days{year{2021}/March/20} + hours{9} + minutes{37};
    auto sun = locateSun(equinox);
    EXPECT_NEAR(sun.declination, 0.0, 0.05);
    EXPECT_NEAR(std::remainder(sun.rightAscension, 360.0), 0.0, 0.1);
}

TEST(SunTest, PerihelionAndAphelionDistance) {
    time_point perihelion = sys_days{year{2021}/January/2} + hours{13} + minutes{51};
    time_point aphelion = sys_days{year{2021}/July/5} + hours{22} + minutes{27};
    EXPECT_NEAR(sunPositionJ2000(perihelion).magnitude() / ASTRONOMICAL_UNIT, 0.98326, 5e-4);
    EXPECT_NEAR(sunPositionJ2000(aphelion).magnitude() / ASTRONOMICAL_UNIT, 1.01671, 5e-4);
}

TEST(SunTest, SubSolarPointNearGreenwichAtNoon) {
    // Apparent noon at Greenwich is about 12:01.6 UTC on this day
    time_point noon = sys_days{year{2021}/June/21} + hours{12};
    auto sun = locateSun(noon);
    EXPECT_NEAR(sun.subPoint.lonInDegrees, 0.4, 0.6);
    EXPECT_NEAR(sun.subPoint.latInDegrees, sun.declination, 0.01);
    EXPECT_NEAR(sun.subPoint.altInMeters / ASTRONOMICAL_UNIT, 1.0, 0.02);
}

TEST(SunTest, SubSolarPointMovesWest) {
    time_point noon = sys_days{year{2021}/June/21} + hours{12};
    auto before = locateSun(noon);
    auto after = locateSun(noon + hours{1});
    // About 15 degrees per hour
    EXPECT_NEAR(before.subPoint.lonInDegrees - after.subPoint.lonInDegrees, 15.0, 0.1);
}

// ============================================================================
// Moon Tests
// ============================================================================

TEST(MoonTest, PerigeeDistance) {
    time_point perigee = sys_days{year{2021}/May/26} + hours{1} + minutes{50};
    EXPECT_NEAR(moonPositionJ2000(perigee).magnitude() / 1000.0, 357309.0, 1000.0);
}

TEST(MoonTest, OppositeTheSunDuringLunarEclipse) {
    time_point eclipse = sys_days{year{2021}/May/26} + hours{11} + minutes{19};
    auto moon = moonPositionJ2000(eclipse);
    auto sun = sunPositionJ2000(eclipse);
    EXPECT_NEAR(separationInDegrees(moon.vec(), sun.vec()), 180.0, 1.0);
}

TEST(MoonTest, AlignedWithTheSunDuringSolarEclipse) {
    time_point eclipse = sys_days{year{2021}/June/10} + hours{10} + minutes{42};
    auto moon = moonPositionJ2000(eclipse);
    auto sun = sunPositionJ2000(eclipse);
    EXPECT_LT(separationInDegrees(moon.vec(), sun.vec()), 1.0);
}

TEST(MoonTest, SubLunarPointFollowsDeclination) {
    time_point instant = sys_days{year{2021}/November/20} + hours{19} + minutes{28};
    auto moon = locateMoon(instant);
    EXPECT_LE(std::abs(moon.declination), 29.0);
    EXPECT_NEAR(moon.subPoint.latInDegrees, moon.declination, 0.01);
    EXPECT_GE(moon.subPoint.lonInDegrees, -180.0);
    EXPECT_LE(moon.subPoint.lonInDegrees, 180.0);
}

TEST(MoonTest, ExplicitNutationMatchesRecomputed) {
    time_point instant = sys_days{year{2021}/November/20} + hours{19} + minutes{28};
    auto terms = nutationTerms(julianCenturies(computeJulianTime(instant).jt));
    auto withTerms = locateMoon(instant, terms);
    auto recomputed = locateMoon(instant);
    EXPECT_NEAR(withTerms.rightAscension, recomputed.rightAscension, 1e-9);
    EXPECT_NEAR(withTerms.subPoint.lonInDegrees, recomputed.subPoint.lonInDegrees, 1e-9);
}

}
}
