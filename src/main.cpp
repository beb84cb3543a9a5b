/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

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

std::string formatTimeUTC(const skywatch::time_point tp) {
    return date::format("%F %T UTC", std::chrono::floor<std::chrono::seconds>(tp));
}

std::string formatOptional(const std::optional<double> &value, const std::string_view unit) {
    if (!value.has_value()) {
        return "Unknown";
    }
    return fmt::format("{:.2f} {}", *value, unit);
}

/** Load both stores into the session */
void loadSession(const skywatch::Config &config, skywatch::TrackingSession &session) {
    session.setCatalog(skywatch::loadCatalog(config.getCatalogPath()));

    skywatch::ElementSetStore elementSets;
    skywatch::loadTLEDatabase(config.getTLEPath(), elementSets);
    session.setElementSets(std::move(elementSets));
}

void printLiveTable(const std::vector<skywatch::LiveStateRecord> &records, const skywatch::time_point asOf) {
    constexpr std::string_view rowFormat = "{:>6} {:<24} {:>9} {:>10} {:>11} {:>6} {:<18}";
    std::cout << "Live objects at " << formatTimeUTC(asOf) << ": " << records.size() << std::endl;
    std::cout << fmt::format(rowFormat, "ID", "Name", "Lat", "Lon", "Alt (km)", "RCS", "Class") << std::endl;
    std::cout << fmt::format(rowFormat, std::string(6, '-'), std::string(24, '-'), std::string(9, '-'),
        std::string(10, '-'), std::string(11, '-'), std::string(6, '-'), std::string(18, '-')) << std::endl;
    for (const auto &record : records) {
        double rcs = record.catalog ? record.catalog->radarCrossSection : skywatch::DEFAULT_RADAR_CROSS_SECTION;
        auto missionClass = record.catalog ? skywatch::classify(*record.catalog) : skywatch::MissionClass::Unknown;
        std::cout << fmt::format(rowFormat,
            record.noradID,
            record.name.substr(0, 24),
            fmt::format("{:.3f}", record.position.latInDegrees),
            fmt::format("{:.3f}", record.position.lonInDegrees),
            fmt::format("{:.2f}", record.position.altInKilometers),
            fmt::format("{:.2f}", rcs),
            skywatch::label(missionClass)) << std::endl;
    }
}

void printReport(const skywatch::TargetReport &report, const skywatch::time_point asOf) {
    const auto &record = report.record;
    std::cout << "Target: " << record.name << " (" << record.noradID << ")" << std::endl;
    std::cout << "  Time:         " << formatTimeUTC(asOf) << std::endl;
    std::cout << "  Position:     " << fmt::format("{:.4f}, {:.4f}", record.position.latInDegrees, record.position.lonInDegrees) << std::endl;
    std::cout << "  Altitude:     " << fmt::format("{:.2f} km", record.position.altInKilometers) << std::endl;
    if (record.catalog) {
        const auto &catalog = *record.catalog;
        std::cout << "  Inclination:  " << formatOptional(catalog.inclination, "deg") << std::endl;
        std::cout << "  Period:       " << formatOptional(catalog.period, "min") << std::endl;
        std::cout << "  Size (RCS):   " << fmt::format("{:.2f}", catalog.radarCrossSection) << std::endl;
        if (catalog.objectType) {
            std::cout << "  Object Type:  " << *catalog.objectType << std::endl;
        }
        if (catalog.owner) {
            std::cout << "  Owner:        " << *catalog.owner << std::endl;
        }
        if (catalog.launchDate) {
            std::cout << "  Launched:     " << *catalog.launchDate << std::endl;
        }
    }
    std::cout << "  Mission:      " << skywatch::describe(report.missionClass) << std::endl;
    std::cout << "  Ground Track: " << report.track.size() << " points" << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    skywatch::Config config;
    config.setCatalogPath(expandTilde("~/.skywatch/satcat.csv"));
    config.setTLEPath(expandTilde("~/.skywatch/tle.txt"));

    auto configFile = expandTilde("~/.skywatch.toml");

    CLI::App app{"SkyWatch"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("--catalog",
        [&config](const std::string &path) { config.setCatalogPath(expandTilde(path)); },
        "SATCAT CSV catalog file");
    app.add_option_function<std::string>("--tle",
        [&config](const std::string &path) { config.setTLEPath(expandTilde(path)); },
        "Local TLE database file");
    app.add_option_function<int>("--threads",
        [&config](const int t) { config.setThreads(t); },
        "Worker threads used to propagate (default 1)");
    app.add_option_function<std::string>("--time",
        [&config](const std::string &timeStr) {
            std::istringstream in(timeStr);
            skywatch::time_point tp;
            in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
            if (in.fail()) {
                throw CLI::ValidationError("--time", "Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
            }
            config.setTime(tp);
        }, "Time at which to compute positions (format: YYYY-MM-DD HH:MM:SS UTC, default now)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");

    app.ignore_case();

    auto updateCommand = app.add_subcommand("update", "Update local TLE data from CelesTrak");
    std::vector<std::string> groups;
    updateCommand->add_option("group", groups, "CelesTrak TLE group(s) to download (default: active)");

    auto liveCommand = app.add_subcommand("live", "Display the live position of every catalogued object");

    auto reportCommand = app.add_subcommand("report", "Display a target report for one object");
    int reportID = 0;
    reportCommand->add_option("id", reportID, "Norad ID of the satellite (ie. 25544)")->required();

    auto trackCommand = app.add_subcommand("track", "Display the predicted ground track of one object");
    int trackID = 0;
    trackCommand->add_option("id", trackID, "Norad ID of the satellite (ie. 25544)")->required();
    trackCommand->add_option_function<double>("--horizon",
        [&config](const double m) { config.setHorizonMinutes(m); },
        "Minutes ahead to predict (default 100)");
    trackCommand->add_option_function<double>("--step",
        [&config](const double m) { config.setStepMinutes(m); },
        "Minutes between samples (default 4)");

    auto watchCommand = app.add_subcommand("watch", "Run tracking cycles until interrupted");
    watchCommand->add_option_function<int>("id",
        [&config](const int id) { config.setTarget(id); },
        "Norad ID of a satellite to report on every cycle");
    watchCommand->add_option_function<int>("--interval",
        [&config](const int s) { config.setIntervalSeconds(s); },
        "Seconds between tracking cycles (default 10)");
    watchCommand->add_option_function<int>("--refresh",
        [&config](const int m) { config.setRefreshMinutes(m); },
        "Minutes between TLE database reloads (default 60)");

    // Command callbacks

    updateCommand->final_callback([&config, &groups](void) {
        try {
            skywatch::ElementSetStore elementSets;
            skywatch::loadTLEDatabase(config.getTLEPath(), elementSets);

            if (groups.empty()) {
                groups.emplace_back(skywatch::celestrak::DEFAULT_GROUP);
            }

            for (const auto &group : groups) {
                std::cout << "Downloading TLE data for group: " << group << "..." << std::flush;
                auto response = skywatch::celestrak::getTLE(group);
                int skipped = 0;
                for (const auto &tle : response.entries) {
                    try {
                        auto set = skywatch::parseElementSet(tle);
                        elementSets.insert_or_assign(set.getNoradID(), std::move(set));
                    } catch (const std::invalid_argument &e) {
                        spdlog::warn("Skipping malformed TLE entry: {}", e.what());
                        skipped++;
                    }
                }
                std::cout << " Done." << std::endl << std::flush;
                if (skipped > 0) {
                    std::cerr << "Skipped " << skipped << " malformed entries." << std::endl;
                }
            }

            skywatch::saveTLEDatabase(config.getTLEPath(), elementSets);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    liveCommand->final_callback([&config](void) {
        try {
            skywatch::TrackingSession session;
            loadSession(config, session);

            auto asOf = config.getTime();
            skywatch::FusionOptions options;
            options.threads = config.getThreads();
            printLiveTable(session.cycle(asOf, options), asOf);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    reportCommand->final_callback([&config, &reportID](void) {
        try {
            skywatch::TrackingSession session;
            loadSession(config, session);

            auto asOf = config.getTime();
            skywatch::TrackOptions trackOptions;
            trackOptions.horizonMinutes = config.getHorizonMinutes();
            trackOptions.stepMinutes = config.getStepMinutes();

            auto report = session.report(reportID, asOf, trackOptions);
            if (!report) {
                std::cerr << "Satellite with Norad ID " << reportID << " is not being tracked." << std::endl;
                std::exit(1);
            }
            printReport(*report, asOf);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    trackCommand->final_callback([&config, &trackID](void) {
        try {
            skywatch::ElementSetStore elementSets;
            skywatch::loadTLEDatabase(config.getTLEPath(), elementSets);
            auto it = elementSets.find(trackID);
            if (it == elementSets.end()) {
                std::cerr << "Satellite with Norad ID " << trackID << " not found in the local TLE database." << std::endl;
                std::exit(1);
            }

            auto track = skywatch::sampleTrack(it->second, config.getTime(),
                                               config.getHorizonMinutes(), config.getStepMinutes());
            auto points = track.collect();
            std::cout << "Ground track for " << it->second.getName() << " (" << trackID << "): "
                      << points.size() << " points" << std::endl;
            for (std::size_t k = 0; k < points.size(); ++k) {
                std::cout << fmt::format("{}  {:9.4f} {:10.4f}", formatTimeUTC(track.timeAt(k)),
                                         points[k].latInDegrees, points[k].lonInDegrees) << std::endl;
            }
            if (points.size() < track.size()) {
                std::cerr << "Propagation failed after " << points.size() << " of "
                          << track.size() << " points." << std::endl;
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    watchCommand->final_callback([&config](void) {
        try {
            skywatch::TrackingSession session;
            loadSession(config, session);

            skywatch::Monitor monitor(config, session);
            monitor.start();
            monitor.wait();
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
