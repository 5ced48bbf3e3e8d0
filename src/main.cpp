/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcore.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <format>
#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Read a whole text file */
std::string readFile(const std::string &path) {
    std::string expanded = expandTilde(path);
    if (!fs::exists(expanded)) {
        throw std::runtime_error("File not found: " + expanded);
    }
    std::ifstream in(expanded);
    if (!in) {
        throw std::runtime_error("Unable to open file: " + expanded);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

/** Parse "YYYY-MM-DD HH:MM:SS" as UTC, falling back to ISO-8601 with a T separator */
std::chrono::system_clock::time_point parseTime(const std::string &timeStr) {
    std::istringstream in(timeStr);
    std::chrono::system_clock::time_point tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (!in.fail()) {
        return tp;
    }
    return orbitcore::parseInstant(timeStr);
}

/** Build a KeplerOverride from a, e, i, raan, argp, M */
orbitcore::KeplerOverride toKeplerOverride(const std::vector<double> &values) {
    if (values.size() != 6) {
        throw std::invalid_argument("Expected six Keplerian elements: a(km) e i raan argp M");
    }
    return orbitcore::KeplerOverride{
        .semiMajorAxisInKilometers = values[0],
        .eccentricity = values[1],
        .inclination = values[2],
        .rightAscensionOfNode = values[3],
        .argumentOfPeriapsis = values[4],
        .meanAnomaly = values[5]
    };
}

void printState(std::ostream &os, const std::string &label, const orbitcore::Vec3 &r, const orbitcore::Vec3 &v) {
    os << std::format("  {:<8} r = [{:14.3f} {:14.3f} {:14.3f}] m", label, r.x, r.y, r.z) << std::endl;
    os << std::format("  {:<8} v = [{:14.5f} {:14.5f} {:14.5f}] m/s", "", v.x, v.y, v.z) << std::endl;
}

void printFleet(std::ostream &os, const std::vector<orbitcore::FleetEntry> &fleet) {
    constexpr std::string_view rowFormat = "  {:<24} {:>6} {:>9.4f} {:>10.4f} {:>10.1f}";
    for (const auto &entry : fleet) {
        os << std::format(rowFormat, entry.name.substr(0, 24), entry.noradID,
                          entry.geodetic.latInDegrees, entry.geodetic.lonInDegrees,
                          entry.geodetic.altInMeters / 1000.0) << std::endl;
    }
}

/** Program entry point */
int main(int argc, char* argv[]) {

    orbitcore::Config config;

    auto configFile = expandTilde("~/.orbitcore.toml");

    CLI::App app{"OrbitCore"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");

    app.ignore_case();

    // State vector text, shared by track, kepler and convert

    std::optional<std::string> osvText;

    // track command - run the per-frame pipeline
    auto trackCommand = app.add_subcommand("track", "Run the frame loop and print one line per frame");

    std::vector<std::string> tleFiles;
    std::string oemFile;
    std::string colorFile;
    std::string telemetryText;
    std::vector<double> keplerValues;
    std::optional<std::size_t> frameLimit;
    bool showFleet = false;

    trackCommand->add_option_function<std::string>("--source",
        [&config](const std::string &name) { config.setDataSource(orbitcore::parseDataSource(name)); },
        "Primary data source: telemetry, oem, tle or manual (default telemetry)");
    trackCommand->add_option_function<std::string>("--frame",
        [&config](const std::string &name) { config.setDisplayFrame(orbitcore::parseDisplayFrame(name)); },
        "Display frame: j2000 or ecef (default ecef)");
    trackCommand->add_option_function<double>("--warp",
        [&config](const double seconds) {
            config.setWarpEnabled(true);
            config.setWarpSeconds(seconds);
        },
        "Advance the simulation by this many seconds per frame (-60 to 60)");
    trackCommand->add_flag_function("--free-running",
        [&config](const int64_t v) { config.setFreeRunning(v > 0); },
        "Follow the wall clock instead of a fixed instant");
    trackCommand->add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) { config.setManualInstant(parseTime(timeStr)); },
        "Start the simulation at this instant (format: YYYY-MM-DD HH:MM:SS UTC)");
    trackCommand->add_option_function<std::vector<int>>("--delta",
        [&config](const std::vector<int> &values) {
            orbitcore::ManualDelta delta;
            delta.days = values.size() > 0 ? values[0] : 0;
            delta.hours = values.size() > 1 ? values[1] : 0;
            delta.minutes = values.size() > 2 ? values[2] : 0;
            delta.seconds = values.size() > 3 ? values[3] : 0;
            config.setManualDelta(delta);
        },
        "Offset added to the simulation instant: days [hours [minutes [seconds]]]")->expected(1, 4);
    trackCommand->add_option("--tle", tleFiles, "TLE file(s); the file whose first epoch precedes the instant is active");
    trackCommand->add_option_function<std::string>("--target",
        [&config](const std::string &name) { config.setTargetName(name); },
        "Name of the primary satellite in the TLE files (default: first)");
    trackCommand->add_option("--oem", oemFile, "Ephemeris table (OEM) file");
    trackCommand->add_option("--telemetry", telemetryText, "Telemetry state vector: \"time x y z vx vy vz\" (km, km/s)");
    trackCommand->add_option("--osv", osvText, "Manual state vector: \"time x y z vx vy vz\" (km, km/s)");
    trackCommand->add_option("--kepler", keplerValues, "Override elements: a(km) e i raan argp M (degrees)")->expected(6);
    trackCommand->add_option("--colors", colorFile, "Colour map file with \"name,r,g,b\" lines");
    trackCommand->add_option_function<int>("--orbits-before",
        [&config](const int n) { config.setOrbitsBefore(n); },
        "Orbits of trail behind the primary (default 1)");
    trackCommand->add_option_function<int>("--orbits-after",
        [&config](const int n) { config.setOrbitsAfter(n); },
        "Orbits of trail ahead of the primary (default 1)");
    trackCommand->add_option_function<int>("--orbit-points",
        [&config](const int n) { config.setOrbitPoints(n); },
        "Orbit trail resolution (default 100)");
    trackCommand->add_option_function<int>("--fps",
        [&config](const int fps) { config.setFramesPerSecond(fps); },
        "Frames per second (default 10)");
    trackCommand->add_option("--frames", frameLimit, "Stop after this many frames");
    trackCommand->add_flag("--fleet", showFleet, "Print the geodetic position of every satellite each frame");

    // kepler command - elements from a state vector
    auto keplerCommand = app.add_subcommand("kepler", "Display the Keplerian elements of a state vector");

    std::optional<std::string> propagateTime;
    keplerCommand->add_option("osv", osvText, "State vector: \"time x y z vx vy vz\" (km, km/s)")->required();
    keplerCommand->add_option("--at", propagateTime, "Also propagate the elements to this instant");

    // convert command - frame conversion of a state vector
    auto convertCommand = app.add_subcommand("convert", "Display a J2000 state vector in every supported frame");
    convertCommand->add_option("osv", osvText, "State vector: \"time x y z vx vy vz\" (km, km/s)")->required();

    // tle command - TLE inspection and export
    auto tleCommand = app.add_subcommand("tle", "Inspect or create two-line element sets");

    std::string tleFile;
    auto tleInfoCommand = tleCommand->add_subcommand("info", "Display every satellite in a TLE file");
    tleInfoCommand->add_option("file", tleFile, "TLE file")->required();

    std::string tleName = "OBJECT";
    int tleNoradID = 0;
    std::vector<double> tleKepler;
    auto tleFromKeplerCommand = tleCommand->add_subcommand("from-kepler", "Create a TLE from Keplerian elements");
    tleFromKeplerCommand->add_option("elements", tleKepler, "a(km) e i raan argp M (degrees)")->expected(6)->required();
    tleFromKeplerCommand->add_option("--name", tleName, "Satellite name (default OBJECT)");
    tleFromKeplerCommand->add_option("--norad", tleNoradID, "Catalog number (default 0)");
    tleFromKeplerCommand->add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) { config.setManualInstant(parseTime(timeStr)); },
        "Epoch of the elements (format: YYYY-MM-DD HH:MM:SS UTC, default now)");

    // Command callbacks

    trackCommand->final_callback([&]() {
        using namespace orbitcore;
        try {
            if (!keplerValues.empty()) {
                config.setKeplerOverride(toKeplerOverride(keplerValues));
                config.setKeplerOverrideEnabled(true);
            }

            SimulationContext context(config);
            auto &selector = context.getDataSourceSelector();
            if (!telemetryText.empty()) {
                selector.setTelemetry(parseStateVector(telemetryText));
            }
            if (osvText) {
                selector.setManualVector(parseStateVector(*osvText));
            }
            if (!oemFile.empty()) {
                selector.setEphemerisTable(EphemerisTable::parse(readFile(oemFile)));
            }
            if (!colorFile.empty()) {
                context.setColorMap(readFile(colorFile));
            }

            auto now = std::chrono::system_clock::now();
            context.start(now);
            if (!tleFiles.empty()) {
                std::vector<std::pair<std::string, std::string>> files;
                for (const auto &file : tleFiles) {
                    files.emplace_back(file, readFile(file));
                }
                context.loadTleFiles(files, now);
            }

            FrameLoop loop(context);
            loop.setFrameLimit(frameLimit);
            loop.setFrameCallback([showFleet](const FrameResult &result) {
                std::cout << result << std::endl;
                if (showFleet) {
                    printFleet(std::cout, result.fleet);
                }
            });
            loop.start();
            loop.wait();
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    keplerCommand->final_callback([&osvText, &propagateTime]() {
        using namespace orbitcore;
        try {
            auto osv = parseStateVector(*osvText);
            auto elements = osvToKepler(osv);
            std::cout << elements << std::endl;
            std::cout << std::format("  Period: {:.3f} min", computePeriod(elements.semiMajorAxis, elements.mu) / 60.0) << std::endl;
            if (propagateTime) {
                auto target = parseTime(*propagateTime);
                auto propagated = propagate(elements, target);
                if (!propagated) {
                    std::cerr << "Propagation did not converge." << std::endl;
                    std::exit(1);
                }
                std::cout << formatStateVector(*propagated) << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    convertCommand->final_callback([&osvText]() {
        using namespace orbitcore;
        try {
            auto osv = parseStateVector(*osvText);
            auto cep = osvJ2000ToCEP(osv);
            auto ecef = osvJ2000ToECEF(osv);
            auto geo = cartToWgs84(ecef.position);
            std::cout << "Instant: " << formatInstantUTC(osv.timestamp) << std::endl;
            std::cout << std::format("  GAST:    {:.6f} deg", greenwichSiderealTime(osv.timestamp)) << std::endl;
            printState(std::cout, "J2000", osv.position.vec(), osv.velocity.vec());
            printState(std::cout, "CEP", cep.position.vec(), cep.velocity.vec());
            printState(std::cout, "ECEF", ecef.position.vec(), ecef.velocity.vec());
            std::cout << std::format("  Latitude:  {:.6f} deg", geo.latInDegrees) << std::endl;
            std::cout << std::format("  Longitude: {:.6f} deg", geo.lonInDegrees) << std::endl;
            std::cout << std::format("  Altitude:  {:.3f} km", geo.altInMeters / 1000.0) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    tleCommand->final_callback([tleCommand]() {
        if (tleCommand->get_subcommands().empty()) {
           std::cerr << tleCommand->help() << std::endl;
           std::exit(1);
        }
    });

    tleInfoCommand->final_callback([&tleFile]() {
        try {
            auto satellites = orbitcore::loadTLEDatabase(expandTilde(tleFile));
            for (const auto &satellite : satellites) {
                satellite.printInfo(std::cout);
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    tleFromKeplerCommand->final_callback([&config, &tleKepler, &tleName, &tleNoradID]() {
        try {
            auto epoch = config.hasManualInstant() ? config.getManualInstant() : std::chrono::system_clock::now();
            auto elements = toKeplerOverride(tleKepler).toElements(epoch);
            auto satellite = orbitcore::tleFromKepler(elements, tleName, tleNoradID);
            std::cout << satellite.getTLE() << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
