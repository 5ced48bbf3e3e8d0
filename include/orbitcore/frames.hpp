/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_FRAMES_HPP
#define __ORBITCORE_FRAMES_HPP

#include <orbitcore/time_system.hpp>

#include <cmath>
#include <optional>
#include <ostream>
#include <string_view>

namespace orbitcore {

// WGS84 ellipsoid
constexpr double WGS84_A = 6378137.0;           // Semi-major axis (m)
constexpr double WGS84_B = 6356752.314245;      // Semi-minor axis (m)
constexpr double WGS84_E2 = (WGS84_A * WGS84_A - WGS84_B * WGS84_B) / (WGS84_A * WGS84_A);

// Earth rotation rate used for the ECEF velocity term (deg/s)
constexpr double EARTH_ROTATION_RATE = 360.985647366 / SECONDS_PER_DAY;

// Number of latitude refinements performed by cartToWgs84
constexpr int WGS84_LATITUDE_ITERATIONS = 5;

/**
 * Reference frames handled by the engine.
 */
enum class Frame {
    J2000,  ///< Earth-centered inertial frame of the J2000.0 epoch
    MOD,    ///< Mean-of-date (J2000 with precession applied)
    CEP,    ///< Celestial Ephemeris Pole, true-of-date (MOD with nutation applied)
    TEME,   ///< True equator, mean equinox; native frame of SGP4 output
    ECEF    ///< Earth-centered, Earth-fixed
};

std::ostream& operator<<(std::ostream &os, const Frame &frame);

/**
 * Frame the primary state and fleet are reported in.
 */
enum class DisplayFrame {
    Inertial,   ///< J2000
    EarthFixed  ///< ECEF
};

std::ostream& operator<<(std::ostream &os, const DisplayFrame &frame);

/**
 * Parses "j2000"/"inertial" or "ecef"/"earth-fixed" (case-insensitive).
 * @throws std::invalid_argument for unknown names
 */
DisplayFrame parseDisplayFrame(std::string_view name);

// ============================================================================
// Vector Types
// ============================================================================

/**
 * 3D vector in Cartesian coordinates with no frame attached.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    /**
     * Returns a unit vector (magnitude = 1) in the same direction as this vector.
     */
    Vec3 normalize() const {
        double mag = magnitude();
        return {x / mag, y / mag, z / mag};
    }
};

/**
 * Cartesian vector expressed in a specific reference frame.
 *
 * Arithmetic is only defined between vectors of the same frame, so a J2000
 * vector cannot be mixed with an ECEF vector without an explicit conversion.
 */
template <Frame F>
struct Vector3 {
    static constexpr Frame frame = F;

    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    static Vector3 from(const Vec3 &v) {
        return {v.x, v.y, v.z};
    }

    Vec3 vec() const {
        return {x, y, z};
    }

    Vector3 operator+(const Vector3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vector3 operator-(const Vector3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vector3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    bool isFinite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }
};

/**
 * Orbital state vector: position (m) and velocity (m/s) at an instant,
 * expressed in frame F.
 */
template <Frame F>
struct StateVector {
    static constexpr Frame frame = F;

    Vector3<F> position;
    Vector3<F> velocity;
    time_point timestamp;

    bool isFinite() const {
        return position.isFinite() && velocity.isFinite();
    }
};

/**
 * Geodetic coordinates on the WGS84 ellipsoid.
 */
struct Geodetic {
    double latInDegrees;    ///< Geodetic latitude (-90 to +90, positive = North)
    double lonInDegrees;    ///< Longitude (-180 to +180, positive = East)
    double altInMeters;     ///< Altitude above the WGS84 ellipsoid surface

    Vector3<Frame::ECEF> toECEF() const;
};

// ============================================================================
// Elementary Rotations
// ============================================================================

/**
 * Rotates a vector counter-clockwise about the X axis.
 */
Vec3 rotateX(const Vec3 &v, double angleInDegrees);

/**
 * Rotates a vector counter-clockwise about the Y axis.
 */
Vec3 rotateY(const Vec3 &v, double angleInDegrees);

/**
 * Rotates a vector counter-clockwise about the Z axis.
 */
Vec3 rotateZ(const Vec3 &v, double angleInDegrees);

/**
 * Returns the supplied nutation terms, or computes them for the instant
 * when none are supplied.
 */
NutationTerms resolveNutation(const std::optional<NutationTerms> &nutation, time_point instant);

/**
 * Greenwich apparent sidereal time (degrees) for an instant.
 */
double greenwichSiderealTime(time_point instant, const std::optional<NutationTerms> &nutation = std::nullopt);

// ============================================================================
// Position Transformations
// ============================================================================

Vector3<Frame::MOD> posJ2000ToMOD(const Vector3<Frame::J2000> &r, time_point instant);
Vector3<Frame::J2000> posMODToJ2000(const Vector3<Frame::MOD> &r, time_point instant);

Vector3<Frame::CEP> posJ2000ToCEP(const Vector3<Frame::J2000> &r, time_point instant,
                                  const std::optional<NutationTerms> &nutation = std::nullopt);
Vector3<Frame::J2000> posCEPToJ2000(const Vector3<Frame::CEP> &r, time_point instant,
                                    const std::optional<NutationTerms> &nutation = std::nullopt);

Vector3<Frame::ECEF> posCEPToECEF(const Vector3<Frame::CEP> &r, time_point instant,
                                  const std::optional<NutationTerms> &nutation = std::nullopt);
Vector3<Frame::CEP> posECEFToCEP(const Vector3<Frame::ECEF> &r, time_point instant,
                                 const std::optional<NutationTerms> &nutation = std::nullopt);

Vector3<Frame::ECEF> posJ2000ToECEF(const Vector3<Frame::J2000> &r, time_point instant,
                                    const std::optional<NutationTerms> &nutation = std::nullopt);
Vector3<Frame::J2000> posECEFToJ2000(const Vector3<Frame::ECEF> &r, time_point instant,
                                     const std::optional<NutationTerms> &nutation = std::nullopt);

// ============================================================================
// State Vector Transformations
// ============================================================================

/**
 * Applies precession and nutation to a J2000 state vector.
 *
 * Velocity is rotated with the same matrix as position; precession and
 * nutation are treated as constant over the state vector's instant.
 */
StateVector<Frame::CEP> osvJ2000ToCEP(const StateVector<Frame::J2000> &osv,
                                      const std::optional<NutationTerms> &nutation = std::nullopt);

/**
 * Inverse of osvJ2000ToCEP.
 */
StateVector<Frame::J2000> osvCEPToJ2000(const StateVector<Frame::CEP> &osv,
                                        const std::optional<NutationTerms> &nutation = std::nullopt);

/**
 * Transforms a J2000 state vector to ECEF.
 *
 * The position is rotated by the Greenwich apparent sidereal time after
 * precession and nutation. The velocity additionally receives the term
 * produced by the time derivative of the sidereal rotation:
 *
 *   v_ECEF = R(θ) v_CEP + dR(θ)/dt r_CEP
 */
StateVector<Frame::ECEF> osvJ2000ToECEF(const StateVector<Frame::J2000> &osv,
                                        const std::optional<NutationTerms> &nutation = std::nullopt);

/**
 * Inverse of osvJ2000ToECEF, including the Earth rotation velocity term.
 */
StateVector<Frame::J2000> osvECEFToJ2000(const StateVector<Frame::ECEF> &osv,
                                         const std::optional<NutationTerms> &nutation = std::nullopt);

/**
 * Transforms SGP4 output (TEME) to J2000.
 *
 * TEME differs from the true-of-date frame by the equation of the equinoxes,
 * so the state is first rotated into CEP and then carried back through
 * nutation and precession.
 */
StateVector<Frame::J2000> osvTEMEToJ2000(const StateVector<Frame::TEME> &osv,
                                         const std::optional<NutationTerms> &nutation = std::nullopt);

// ============================================================================
// WGS84
// ============================================================================

/**
 * Converts ECEF coordinates (m) to WGS84 geodetic coordinates.
 *
 * Latitude is refined a fixed number of times (WGS84_LATITUDE_ITERATIONS)
 * without a residual check. This is a bounded approximation: for points
 * between the surface and geostationary altitude the residual is well below
 * a millimeter.
 */
Geodetic cartToWgs84(const Vector3<Frame::ECEF> &r);

/**
 * Converts WGS84 geodetic coordinates to ECEF (m).
 */
Vector3<Frame::ECEF> wgs84ToCart(double latInDegrees, double lonInDegrees, double altInMeters);

}

#endif
