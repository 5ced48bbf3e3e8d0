/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_SATELLITE_HPP
#define __ORBITCORE_SATELLITE_HPP

#include <orbitcore/frames.hpp>
#include <orbitcore/kepler.hpp>
#include <orbitcore/sgp4.hpp>
#include <orbitcore/time_system.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orbitcore {

// Re-export SGP4 exceptions
using SGP4Exception = sgp4::SGP4Exception;
using SatelliteDecayedException = sgp4::SatelliteDecayedException;
using InvalidOrbitException = sgp4::InvalidOrbitException;

// Minimum length of a TLE data line without its checksum digit
constexpr std::size_t TLE_LINE_LENGTH = 68;

/**
 * Display colour of a satellite.
 */
struct Color {
    std::uint8_t r = 200;
    std::uint8_t g = 200;
    std::uint8_t b = 200;

    bool operator==(const Color &other) const = default;
};

// ============================================================================
// Satellite Class with SGP4 Propagation
// ============================================================================

/**
 * A satellite described by a two-line element set.
 *
 * The SGP4 state is initialized lazily on first propagation and the last
 * propagation result is cached, so this class is not thread-safe for the
 * same instance.
 *
 * Usage:
 *   Satellite sat;
 *   sat.updateFromTLE(tleString);
 *   auto osv = sat.getJ2000(instant);
 */
class Satellite {
public:
    Satellite() = default;
    ~Satellite() = default;

    /**
     * Update orbital elements from a TLE string with a separate name.
     */
    void updateFromTLE(const std::string_view &name, const std::string_view &tle);

    /**
     * Update orbital elements from a TLE string (name from TLE line 0).
     *
     * @throws std::invalid_argument if either data line is missing, too short
     *         or contains a field that is not a number
     */
    void updateFromTLE(const std::string_view &tle);

    // Accessors for TLE data
    std::string getName() const;
    void setName(const std::string_view &name);
    int getNoradID() const;
    char getClassification() const;
    std::string getDesignator() const;
    time_point getEpoch() const;
    double getFirstDerivativeMeanMotion() const;
    double getSecondDerivativeMeanMotion() const;
    double getBstarDragTerm() const;
    int getElementSetNumber() const;

    // Accessors for orbital elements
    double getInclination() const;
    double getRightAscensionOfAscendingNode() const;
    double getEccentricity() const;
    double getArgumentOfPerigee() const;
    double getMeanAnomaly() const;
    double getMeanMotion() const;
    int getRevolutionNumberAtEpoch() const;

    // Raw data lines as they were parsed
    const std::string& getLine1() const;
    const std::string& getLine2() const;

    Color getColor() const;
    void setColor(const Color &color);

    /**
     * Runs SGP4 for an instant.
     *
     * @param instant The time for which to compute the state
     * @return Position (km) and velocity (km/s) in TEME
     * @throws SatelliteDecayedException if the satellite has decayed
     * @throws InvalidOrbitException if orbital elements are invalid
     */
    sgp4::Result propagate(time_point instant) const;

    /**
     * SGP4 state at an instant in TEME, converted to meters and m/s.
     */
    StateVector<Frame::TEME> getTEME(time_point instant) const;

    /**
     * SGP4 state at an instant, converted to meters and rotated to J2000.
     */
    StateVector<Frame::J2000> getJ2000(time_point instant,
                                       const std::optional<NutationTerms> &nutation = std::nullopt) const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

    /**
     * Get the 3-line TLE representation with freshly computed checksums.
     */
    std::string getTLE() const;

private:
    // ========================================================================
    // TLE Data
    // ========================================================================

    // Satellite Identification
    std::string name;

    // First Line - Satellite Identification
    int noradID = 0;
    char classification = 'U';
    std::string designator;
    time_point epoch;
    double firstDerivativeMeanMotion = 0.0;
    double secondDerivativeMeanMotion = 0.0;
    double bstarDragTerm = 0.0;
    int elementSetNumber = 0;

    // Second Line - Orbital Elements (in degrees, except eccentricity)
    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;
    double meanAnomaly = 0.0;
    double meanMotion = 0.0;  // revolutions per day
    int revolutionNumberAtEpoch = 0;

    std::string line1;
    std::string line2;

    Color color;

    // SGP4 State
    mutable sgp4::State sgp4State_;

    /**
     * Ensure SGP4 state is initialized before propagation.
     * Called lazily on first propagation.
     */
    void ensureSGP4Initialized() const;

    /**
     * Formats both data lines (with checksums) from the parsed fields.
     */
    std::pair<std::string, std::string> formatLines() const;

    friend Satellite tleFromKepler(const KeplerianElements &elements, const std::string_view &name, int noradID);
};

/**
 * Converts an SGP4 result (km, km/s) to a TEME state vector in meters.
 */
StateVector<Frame::TEME> toStateVector(const sgp4::Result &result, time_point instant);

// ============================================================================
// TLE Database Functions
// ============================================================================

/**
 * Parses a roster of satellites from TLE text (a name line followed by two
 * data lines per satellite).
 *
 * Entries that fail to parse are logged and skipped. When a name occurs more
 * than once, later occurrences are renamed to "<name>_<index>", where index
 * is the zero-based position of the entry in the text.
 */
std::vector<Satellite> loadTLEDatabase(std::istream &s);
std::vector<Satellite> loadTLEDatabase(const std::string &filepath);
std::vector<Satellite> parseTLEDatabase(const std::string_view &text);

void saveTLEDatabase(std::ostream &s, const std::vector<Satellite> &database);

/**
 * Epoch of the first satellite in TLE text, if any entry parses.
 */
std::optional<time_point> firstEpoch(const std::string_view &text);

/**
 * Applies "name,r,g,b" colour lines to a roster. Unknown names and
 * malformed lines are logged and ignored.
 *
 * @return Number of satellites that received a colour
 */
int applyColorMap(std::vector<Satellite> &database, const std::string_view &colorMap);

// TLE formatting utilities
int calculateChecksum(const std::string_view &line);
bool verifyChecksum(const std::string_view &line);
std::string toTLEExponential(double value);
std::string formatFirstDerivative(double value);

/**
 * Builds a satellite whose TLE reproduces a set of Keplerian elements.
 * The mean motion is 86400 / period revolutions per day; drag terms are zero.
 */
Satellite tleFromKepler(const KeplerianElements &elements, const std::string_view &name, int noradID = 0);

}

#endif
