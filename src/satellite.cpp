/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore/satellite.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>

#include <date/date.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace orbitcore {

namespace {

// Helper function to trim leading spaces from a string_view
std::string_view trimLeft(const std::string_view &str) {
    auto pos = str.find_first_not_of(" \t");
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

// Helper function to trim trailing spaces and carriage returns from a string_view
std::string_view trimRight(const std::string_view &str) {
    auto pos = str.find_last_not_of(" \t\r");
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

std::string_view trim(const std::string_view &str) {
    return trimLeft(trimRight(str));
}

// Helper function to convert substring to numeric type
template <typename T>
T toNumber(const std::string_view &str) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw std::invalid_argument("Couldn't convert value: '" + std::string(str) + "'");
    }
    return value;
}

// Fixed-column TLE field, trimmed
std::string_view field(const std::string_view &line, std::size_t column, std::size_t width) {
    return trim(line.substr(column - 1, width));
}

// TLE assumed-decimal exponential field, e.g. "11606-4" -> 0.11606e-4 or "-12345-5"
double fromExponentialString(const std::string_view &str) {
    if (str.empty()) {
        return 0.0;
    }

    std::string_view digits = str;
    bool negative = false;
    if (digits.front() == '-' || digits.front() == '+') {
        negative = digits.front() == '-';
        digits.remove_prefix(1);
    }

    auto pos = digits.find_first_of("+-");
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Invalid exponential format: " + std::string(str));
    }

    double mantissa = toNumber<double>("0." + std::string(trim(digits.substr(0, pos))));
    int exponent = toNumber<int>(digits.substr(pos + 1));
    if (digits[pos] == '-') {
        exponent = -exponent;
    }

    double value = mantissa * std::pow(10.0, exponent);
    return negative ? -value : value;
}

// Parse the TLE epoch field (YYDDD.DDDDDDDD)
time_point parseEpoch(const std::string_view &epochStr) {
    using namespace std::chrono;

    int y = toNumber<int>(trimLeft(epochStr.substr(0, 2)));
    double dayOfYear = toNumber<double>(trimLeft(epochStr.substr(2)));

    // Two-digit years 57-99 belong to the 1900s
    y += y < 57 ? 2000 : 1900;

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = sys_days{year{y}/January/1} + days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return date + time;
}

// Epoch in TLE format: YYDDD.DDDDDDDD
std::string formatEpoch(time_point epoch) {
    using namespace std::chrono;

    auto epochDays = floor<days>(epoch);
    auto timeOfDay = epoch - epochDays;
    auto fraction = static_cast<long>(std::round(
        duration_cast<duration<double, std::ratio<86400>>>(timeOfDay).count() * 100000000));

    // Rounding can carry into the next day
    if (fraction >= 100000000) {
        epochDays += days{1};
        fraction -= 100000000;
    }

    year_month_day ymd{epochDays};
    int twoDigitYear = static_cast<int>(ymd.year()) % 100;
    int dayOfYear = (epochDays - sys_days{ymd.year()/January/1}).count() + 1;

    std::ostringstream ss;
    ss << std::setw(2) << std::setfill('0') << twoDigitYear
       << std::setw(3) << std::setfill('0') << dayOfYear
       << '.' << std::setw(8) << std::setfill('0') << fraction;
    return ss.str();
}

}

// ============================================================================
// SGP4 Initialization and Propagation (delegates to sgp4 namespace)
// ============================================================================

void Satellite::ensureSGP4Initialized() const {
    if (!sgp4State_.initialized) {
        sgp4::Elements elements{
            .epoch_jd = toJulianDate(epoch),
            .bstar = bstarDragTerm,
            .inclination = inclination * DEGREES_TO_RADIANS,
            .raan = rightAscensionOfAscendingNode * DEGREES_TO_RADIANS,
            .eccentricity = eccentricity,
            .arg_perigee = argumentOfPerigee * DEGREES_TO_RADIANS,
            .mean_anomaly = meanAnomaly * DEGREES_TO_RADIANS,
            .mean_motion = meanMotion * sgp4::TWO_PI / 1440.0
        };
        sgp4::initialize(sgp4State_, elements);
    }
}

sgp4::Result Satellite::propagate(time_point instant) const {
    using namespace std::chrono;

    ensureSGP4Initialized();

    // Time since epoch in minutes
    double tsince = duration_cast<duration<double, std::ratio<60>>>(instant - epoch).count();

    return sgp4::propagate(sgp4State_, tsince);
}

StateVector<Frame::TEME> toStateVector(const sgp4::Result &result, time_point instant) {
    return {
        .position = {result.r[0] * 1000.0, result.r[1] * 1000.0, result.r[2] * 1000.0},
        .velocity = {result.v[0] * 1000.0, result.v[1] * 1000.0, result.v[2] * 1000.0},
        .timestamp = instant
    };
}

StateVector<Frame::TEME> Satellite::getTEME(time_point instant) const {
    return toStateVector(propagate(instant), instant);
}

StateVector<Frame::J2000> Satellite::getJ2000(time_point instant,
                                              const std::optional<NutationTerms> &nutation) const {
    return osvTEMEToJ2000(getTEME(instant), nutation);
}

// ============================================================================
// TLE Parsing
// ============================================================================

void Satellite::updateFromTLE(const std::string_view &name, const std::string_view &tle) {
    updateFromTLE(tle);
    this->name = std::string(trim(name));
}

void Satellite::updateFromTLE(const std::string_view &tle) {
    std::string nameLine;
    std::string first;
    std::string second;

    for (auto line : tle | std::views::split('\n')) {
        // GCC 11 doesn't support constructing string/string_view from split_view iterators
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        std::string_view lineView = trim(lineStr);

        if (lineView.starts_with("1 ")) {
            first = lineView;
        } else if (lineView.starts_with("2 ")) {
            second = lineView;
        } else if (first.empty() && second.empty() && !lineView.empty()) {
            // A line before the data lines is the name
            nameLine = lineView;
        }

        if (!first.empty() && !second.empty()) {
            break;
        }
    }

    if (first.empty() || second.empty()) {
        throw std::invalid_argument("TLE is missing a data line");
    }
    if (first.size() < TLE_LINE_LENGTH || second.size() < TLE_LINE_LENGTH) {
        throw std::invalid_argument("TLE data line is too short: '"
                                    + (first.size() < TLE_LINE_LENGTH ? first : second) + "'");
    }

    // Parse into a copy so a failure leaves this satellite untouched
    Satellite parsed;
    parsed.name = nameLine;
    parsed.color = color;

    parsed.noradID = toNumber<int>(field(first, 3, 5));
    parsed.classification = first[7];
    parsed.designator = std::string(field(first, 10, 8));
    parsed.epoch = parseEpoch(first.substr(18, 14));
    parsed.firstDerivativeMeanMotion = toNumber<double>(field(first, 34, 10));
    parsed.secondDerivativeMeanMotion = fromExponentialString(field(first, 45, 8));
    parsed.bstarDragTerm = fromExponentialString(field(first, 54, 8));
    auto elementSet = field(first, 65, 4);
    parsed.elementSetNumber = elementSet.empty() ? 0 : toNumber<int>(elementSet);

    parsed.inclination = toNumber<double>(field(second, 9, 8));
    parsed.rightAscensionOfAscendingNode = toNumber<double>(field(second, 18, 8));
    // Eccentricity has an implied leading decimal point
    parsed.eccentricity = toNumber<double>("0." + std::string(field(second, 27, 7)));
    parsed.argumentOfPerigee = toNumber<double>(field(second, 35, 8));
    parsed.meanAnomaly = toNumber<double>(field(second, 44, 8));
    parsed.meanMotion = toNumber<double>(field(second, 53, 11));
    auto revolution = field(second, 64, 5);
    parsed.revolutionNumberAtEpoch = revolution.empty() ? 0 : toNumber<int>(revolution);

    if (parsed.meanMotion <= 0.0) {
        throw std::invalid_argument("TLE mean motion must be positive: '" + second + "'");
    }

    for (const auto &line : {first, second}) {
        if (!verifyChecksum(line)) {
            warn("Checksum mismatch for {} line: {}", parsed.name.empty() ? "unnamed" : parsed.name, line);
        }
    }

    parsed.line1 = std::move(first);
    parsed.line2 = std::move(second);

    *this = std::move(parsed);
}

std::string Satellite::getName() const {
    return name;
}

void Satellite::setName(const std::string_view &newName) {
    name = std::string(newName);
}

int Satellite::getNoradID() const {
    return noradID;
}

char Satellite::getClassification() const {
    return classification;
}

std::string Satellite::getDesignator() const {
    return designator;
}

time_point Satellite::getEpoch() const {
    return epoch;
}

double Satellite::getFirstDerivativeMeanMotion() const {
    return firstDerivativeMeanMotion;
}

double Satellite::getSecondDerivativeMeanMotion() const {
    return secondDerivativeMeanMotion;
}

double Satellite::getBstarDragTerm() const {
    return bstarDragTerm;
}

int Satellite::getElementSetNumber() const {
    return elementSetNumber;
}

double Satellite::getInclination() const {
    return inclination;
}

double Satellite::getRightAscensionOfAscendingNode() const {
    return rightAscensionOfAscendingNode;
}

double Satellite::getEccentricity() const {
    return eccentricity;
}

double Satellite::getArgumentOfPerigee() const {
    return argumentOfPerigee;
}

double Satellite::getMeanAnomaly() const {
    return meanAnomaly;
}

double Satellite::getMeanMotion() const {
    return meanMotion;
}

int Satellite::getRevolutionNumberAtEpoch() const {
    return revolutionNumberAtEpoch;
}

const std::string& Satellite::getLine1() const {
    return line1;
}

const std::string& Satellite::getLine2() const {
    return line2;
}

Color Satellite::getColor() const {
    return color;
}

void Satellite::setColor(const Color &c) {
    color = c;
}

void Satellite::printInfo(std::ostream &os) const {
    os << getName() << std::endl;
    os << "  NORAD ID: " << getNoradID() << std::endl;
    os << "  Classification: " << getClassification() << std::endl;
    os << "  Designator: " << getDesignator() << std::endl;
    os << "  Epoch: " << date::format("%F %T UTC", std::chrono::floor<std::chrono::seconds>(getEpoch())) << std::endl;
    os << "  First Derivative of Mean Motion: " << getFirstDerivativeMeanMotion() << std::endl;
    os << "  Second Derivative of Mean Motion: " << getSecondDerivativeMeanMotion() << std::endl;
    os << "  Bstar Drag Term: " << getBstarDragTerm() << std::endl;
    os << "  Inclination: " << getInclination() << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << getRightAscensionOfAscendingNode() << " deg" << std::endl;
    os << "  Eccentricity: " << getEccentricity() << std::endl;
    os << "  Argument of Perigee: " << getArgumentOfPerigee() << " deg" << std::endl;
    os << "  Mean Anomaly: " << getMeanAnomaly() << " deg" << std::endl;
    os << "  Mean Motion: " << getMeanMotion() << " revs per day" << std::endl;
    os << "  Revolution Number at Epoch: " << getRevolutionNumberAtEpoch() << std::endl;
    os << "  Color: " << int(color.r) << "," << int(color.g) << "," << int(color.b) << std::endl;
    os << std::endl;
}

// ============================================================================
// TLE Formatting
// ============================================================================

// Mod 10 sum of digits, with '-' counting as 1
int calculateChecksum(const std::string_view &line) {
    int sum = 0;
    for (char c : line.substr(0, std::min(line.size(), TLE_LINE_LENGTH))) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

bool verifyChecksum(const std::string_view &line) {
    if (line.size() <= TLE_LINE_LENGTH) {
        return false;
    }
    char digit = line[TLE_LINE_LENGTH];
    return digit >= '0' && digit <= '9' && (digit - '0') == calculateChecksum(line);
}

// Format a value in TLE exponential notation (e.g., " 00000+0" or " 15237-3" or "-12345-6")
std::string toTLEExponential(double value) {
    if (value == 0.0) {
        return " 00000+0";
    }

    char sign = (value >= 0) ? ' ' : '-';
    value = std::abs(value);

    // Mantissa in [0.1, 1.0) scaled to five digits
    int exponent = static_cast<int>(std::floor(std::log10(value))) + 1;
    int mantissa = static_cast<int>(std::round(value / std::pow(10.0, exponent) * 100000));
    if (mantissa >= 100000) {
        mantissa = 10000;
        exponent++;
    }

    std::ostringstream ss;
    ss << sign << std::setw(5) << std::setfill('0') << mantissa
       << (exponent >= 0 ? '+' : '-') << std::abs(exponent);
    return ss.str();
}

// Format first derivative of mean motion for TLE (e.g., " .00008010" or "-.00012345")
std::string formatFirstDerivative(double value) {
    char sign = (value >= 0) ? ' ' : '-';
    std::ostringstream ss;
    ss << sign << '.' << std::setw(8) << std::setfill('0')
       << static_cast<long>(std::round(std::abs(value) * 100000000));
    return ss.str();
}

std::pair<std::string, std::string> Satellite::formatLines() const {
    // Columns: 1 line, 3-7 catalog, 8 class, 10-17 designator, 19-32 epoch,
    // 34-43 ndot, 45-52 nddot, 54-61 bstar, 63 type, 65-68 set, 69 checksum
    std::ostringstream first;
    first << "1 "
          << std::setw(5) << std::setfill('0') << noradID
          << classification << ' '
          << std::left << std::setw(8) << std::setfill(' ') << designator << ' '
          << formatEpoch(epoch) << ' '
          << formatFirstDerivative(firstDerivativeMeanMotion) << ' '
          << toTLEExponential(secondDerivativeMeanMotion) << ' '
          << toTLEExponential(bstarDragTerm) << ' '
          << "0 "
          << std::right << std::setw(4) << std::setfill(' ') << (elementSetNumber % 10000);
    std::string firstStr = first.str();
    firstStr += static_cast<char>('0' + calculateChecksum(firstStr));

    // Columns: 1 line, 3-7 catalog, 9-16 incl, 18-25 raan, 27-33 ecc,
    // 35-42 argp, 44-51 M, 53-63 mean motion, 64-68 revolution, 69 checksum
    std::ostringstream second;
    second << "2 "
           << std::setw(5) << std::setfill('0') << noradID << ' '
           << std::fixed << std::setprecision(4) << std::setfill(' ')
           << std::setw(8) << inclination << ' '
           << std::setw(8) << rightAscensionOfAscendingNode << ' '
           << std::setw(7) << std::setfill('0') << static_cast<long>(std::round(eccentricity * 10000000)) << ' '
           << std::setfill(' ')
           << std::setw(8) << argumentOfPerigee << ' '
           << std::setw(8) << meanAnomaly << ' '
           << std::setw(11) << std::setprecision(8) << meanMotion
           << std::setw(5) << std::setfill('0') << (revolutionNumberAtEpoch % 100000);
    std::string secondStr = second.str();
    secondStr += static_cast<char>('0' + calculateChecksum(secondStr));

    return {firstStr, secondStr};
}

std::string Satellite::getTLE() const {
    auto [first, second] = formatLines();
    return name + '\n' + first + '\n' + second + '\n';
}

Satellite tleFromKepler(const KeplerianElements &elements, const std::string_view &name, int noradID) {
    if (elements.semiMajorAxis <= 0.0 || elements.eccentricity < 0.0 || elements.eccentricity >= 1.0) {
        throw std::invalid_argument("Keplerian elements do not describe an elliptical orbit");
    }

    Satellite satellite;
    satellite.name = std::string(name);
    satellite.noradID = noradID;
    satellite.epoch = elements.epoch;
    satellite.inclination = elements.inclination;
    satellite.rightAscensionOfAscendingNode = normalizeDegrees(elements.rightAscensionOfNode);
    satellite.eccentricity = elements.eccentricity;
    satellite.argumentOfPerigee = normalizeDegrees(elements.argumentOfPeriapsis);
    satellite.meanAnomaly = normalizeDegrees(elements.meanAnomaly);
    satellite.meanMotion = SECONDS_PER_DAY / computePeriod(elements.semiMajorAxis, elements.mu);

    auto [first, second] = satellite.formatLines();
    satellite.line1 = first;
    satellite.line2 = second;
    return satellite;
}

// ============================================================================
// TLE Database
// ============================================================================

std::vector<Satellite> loadTLEDatabase(const std::string &filepath) {
    info("Loading TLE database from file: {}", filepath);

    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("TLE database file does not exist: " + filepath);
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open TLE database file: " + filepath);
    }

    return loadTLEDatabase(file);
}

std::vector<Satellite> loadTLEDatabase(std::istream &s) {
    std::vector<Satellite> database;
    std::map<std::string, int> namesSeen;
    std::string line, first, nameLine;
    int entryIndex = 0;
    int skipped = 0;

    while (std::getline(s, line)) {
        std::string_view lineView = trim(line);
        if (lineView.empty()) continue;

        if (lineView.starts_with("1 ")) {
            first = lineView;
            continue;
        }
        if (!lineView.starts_with("2 ")) {
            nameLine = lineView;
            continue;
        }

        int index = entryIndex++;
        if (first.empty()) {
            warn("Skipping TLE entry {} ({}): line 2 without line 1", index, nameLine);
            skipped++;
            nameLine.clear();
            continue;
        }

        try {
            Satellite satellite;
            satellite.updateFromTLE(nameLine + '\n' + first + '\n' + std::string(lineView));

            if (namesSeen[satellite.getName()]++ > 0) {
                satellite.setName(satellite.getName() + "_" + std::to_string(index));
            }
            database.push_back(std::move(satellite));
        } catch (const std::invalid_argument &e) {
            warn("Skipping TLE entry {} ({}): {}", index, nameLine, e.what());
            skipped++;
        }

        first.clear();
        nameLine.clear();
    }

    info("Loaded {} TLE entries ({} skipped).", database.size(), skipped);
    return database;
}

std::vector<Satellite> parseTLEDatabase(const std::string_view &text) {
    std::istringstream stream{std::string(text)};
    return loadTLEDatabase(stream);
}

void saveTLEDatabase(std::ostream &s, const std::vector<Satellite> &database) {
    for (const auto &satellite : database) {
        s << satellite.getTLE();
    }
    debug("Saved {} TLE entries.", database.size());
}

std::optional<time_point> firstEpoch(const std::string_view &text) {
    auto database = parseTLEDatabase(text);
    if (database.empty()) {
        return std::nullopt;
    }
    return database.front().getEpoch();
}

int applyColorMap(std::vector<Satellite> &database, const std::string_view &colorMap) {
    int colored = 0;

    for (auto line : colorMap | std::views::split('\n')) {
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        std::string_view lineView = trim(lineStr);
        if (lineView.empty()) continue;

        // The name may contain commas; the last three fields are the colour
        std::vector<std::string_view> parts;
        std::string_view rest = lineView;
        for (int i = 0; i < 3; i++) {
            auto pos = rest.rfind(',');
            if (pos == std::string_view::npos) break;
            parts.insert(parts.begin(), trim(rest.substr(pos + 1)));
            rest = rest.substr(0, pos);
        }
        if (parts.size() != 3) {
            warn("Ignoring malformed colour line: {}", lineView);
            continue;
        }

        Color color;
        try {
            int r = toNumber<int>(parts[0]);
            int g = toNumber<int>(parts[1]);
            int b = toNumber<int>(parts[2]);
            if (r < 0 || r > 255 || g < 0 || g > 255 || b < 0 || b > 255) {
                throw std::invalid_argument("component out of range");
            }
            color = {static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g), static_cast<std::uint8_t>(b)};
        } catch (const std::invalid_argument &e) {
            warn("Ignoring malformed colour line '{}': {}", lineView, e.what());
            continue;
        }

        std::string_view name = trim(rest);
        bool found = false;
        for (auto &satellite : database) {
            if (satellite.getName() == name) {
                satellite.setColor(color);
                colored++;
                found = true;
            }
        }
        if (!found) {
            warn("Colour given for unknown satellite: {}", name);
        }
    }

    return colored;
}

}
