/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCORE_DATA_SOURCE_HPP
#define __ORBITCORE_DATA_SOURCE_HPP

#include <orbitcore/ephemeris_table.hpp>
#include <orbitcore/frames.hpp>
#include <orbitcore/satellite.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace orbitcore {

/**
 * Where the primary target's state vector comes from.
 */
enum class DataSource {
    Telemetry,          ///< Latest telemetry state vector
    EphemerisTable,     ///< Entry of an OEM table closest to the instant
    TwoLineElements,    ///< SGP4 propagation of the target's TLE
    ManualVector        ///< State vector entered by the operator
};

std::string toString(DataSource source);
std::ostream& operator<<(std::ostream &os, const DataSource &source);

/**
 * Parses a data source name ("telemetry", "oem", "tle", "osv" and the
 * enumerator names are accepted, case-insensitive).
 * @throws std::invalid_argument for unknown names
 */
DataSource parseDataSource(std::string_view name);

/**
 * ISS state vector used as telemetry until a newer one is supplied.
 */
StateVector<Frame::J2000> defaultTelemetry();

/**
 * Chooses among the available data sources and produces one J2000 state
 * vector for the primary target.
 */
class DataSourceSelector {
public:
    DataSourceSelector();

    DataSource getSource() const;
    void setSource(DataSource source);

    const StateVector<Frame::J2000>& getTelemetry() const;
    void setTelemetry(const StateVector<Frame::J2000> &osv);

    const EphemerisTable& getEphemerisTable() const;
    void setEphemerisTable(EphemerisTable table);

    const std::optional<Satellite>& getTarget() const;
    void setTarget(std::optional<Satellite> target);

    const StateVector<Frame::J2000>& getManualVector() const;
    void setManualVector(const StateVector<Frame::J2000> &osv);

    /**
     * True when the selected source already produces a state at the
     * requested instant, so no Keplerian propagation is needed.
     */
    bool producesStateAtInstant() const;

    /**
     * State vector of the primary target for an instant.
     *
     * Telemetry and manual vectors are returned as stored, with their own
     * timestamps. The ephemeris table yields its closest entry. Two-line
     * elements are propagated with SGP4 to the instant and rotated to J2000.
     *
     * @return The state, or std::nullopt when the source has nothing to
     *         offer (empty table, no target, SGP4 failure)
     */
    std::optional<StateVector<Frame::J2000>> createOsv(time_point instant,
                                                       const std::optional<NutationTerms> &nutation = std::nullopt) const;

private:
    DataSource source = DataSource::Telemetry;
    StateVector<Frame::J2000> telemetry;
    EphemerisTable ephemerisTable;
    std::optional<Satellite> target;
    StateVector<Frame::J2000> manualVector;
};

}

#endif
