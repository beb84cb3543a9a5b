/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/monitor.hpp>
#include <skywatch/elements.hpp>
#include <skywatch/mission.hpp>

#include <chrono>

#include <date/date.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;

namespace skywatch {

Monitor::~Monitor() {
    stop();
    if (ioThread.joinable()) {
        info("Waiting for IO thread to finish...");
        ioThread.join();
    }
}

MonitorStatus Monitor::status() {
    return _status.load();
}

void Monitor::start() {
    MonitorStatus expected = MonitorStatus::STOPPED;
    if (!_status.compare_exchange_strong(expected, MonitorStatus::STARTING)) {
        return;
    }
    info("Starting monitor...");

    // A previous run leaves a finished thread and a stopped io_context behind
    if (ioThread.joinable()) {
        ioThread.join();
    }
    if (io.stopped()) {
        io.restart();
    }

    initSignals();

    cycleTimer = std::make_unique<asio::steady_timer>(io);
    refreshTimer = std::make_unique<asio::steady_timer>(io);

    // First cycle runs as soon as the loop starts
    asio::post(io, [this] {
        try {
            runCycle();
        } catch (const std::exception& e) {
            error("Tracking cycle failed: {}", e.what());
        }
        scheduleCycle();
    });
    scheduleRefresh();

    _status.store(MonitorStatus::RUNNING);
    info("Monitor started: cycle every {}s, refresh every {}m.",
         config.getIntervalSeconds(), config.getRefreshMinutes());

    ioThread = std::thread([this] {
        io.run();
        _status.store(MonitorStatus::STOPPED);
        info("Monitor stopped.");
    });
}

void Monitor::initSignals() {
    signals.async_wait([this](auto ec, int sig) {
        if (ec) {
            if (ec == asio::error::operation_aborted) return;
            error("Error receiving signal: {}", ec.message());
        } else {
            info("Received signal {}.", sig);
        }
        stop();
    });
}

void Monitor::scheduleCycle() {
    cycleTimer->expires_after(std::chrono::seconds(config.getIntervalSeconds()));
    cycleTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            try {
                runCycle();
            } catch (const std::exception& e) {
                error("Tracking cycle failed: {}", e.what());
            }
            scheduleCycle(); // Reschedule the timer
        } else if (ec != asio::error::operation_aborted) {
            error("Cycle timer error: {}", ec.message());
        }
    });
}

void Monitor::scheduleRefresh() {
    refreshTimer->expires_after(std::chrono::minutes(config.getRefreshMinutes()));
    refreshTimer->async_wait([this](const asio::error_code& ec) {
        if (!ec) {
            refresh();
            scheduleRefresh(); // Reschedule the timer
        } else if (ec != asio::error::operation_aborted) {
            error("Refresh timer error: {}", ec.message());
        }
    });
}

void Monitor::stop() {
    MonitorStatus expected = MonitorStatus::RUNNING;
    if (!_status.compare_exchange_strong(expected, MonitorStatus::STOPPING)) {
        return;
    }
    info("Stopping monitor...");
    io.stop();
}

void Monitor::wait() {
    if (ioThread.joinable()) {
        ioThread.join();
    }
}

std::size_t Monitor::runCycle() {
    time_point asOf = config.getTime();
    FusionOptions options;
    options.threads = config.getThreads();

    std::vector<LiveStateRecord> records = session.cycle(asOf, options);
    std::size_t cycle = ++cycles;

    info("--- Cycle {} at {} UTC: {} live objects ---", cycle,
         date::format("%F %T", std::chrono::floor<std::chrono::seconds>(asOf)),
         records.size());
    for (const auto& record : records) {
        debug("- {:>6} {:<24} Lat {:8.3f}, Lon {:9.3f}, Alt {:10.2f} km",
              record.noradID, record.name,
              record.position.latInDegrees,
              record.position.lonInDegrees,
              record.position.altInKilometers);
    }

    auto target = config.getTarget();
    if (target.has_value()) {
        logTarget(*target, asOf);
    }
    return records.size();
}

void Monitor::logTarget(int noradID, time_point asOf) {
    TrackOptions trackOptions;
    trackOptions.horizonMinutes = config.getHorizonMinutes();
    trackOptions.stepMinutes = config.getStepMinutes();

    auto report = session.report(noradID, asOf, trackOptions);
    if (!report) {
        warn("Target {} is not being tracked.", noradID);
        return;
    }
    const GeodeticPosition& position = report->record.position;
    info("- Target {} ({}): Lat {:.4f}, Lon {:.4f}, Alt {:.2f} km, {}",
         noradID, report->record.name,
         position.latInDegrees, position.lonInDegrees, position.altInKilometers,
         label(report->missionClass));
    if (!report->track.empty()) {
        const TrackPoint& last = report->track.back();
        info("- Track: {} points, ending at Lat {:.4f}, Lon {:.4f}",
             report->track.size(), last.latInDegrees, last.lonInDegrees);
    }
}

bool Monitor::refresh() {
    const std::string path = config.getTLEPath();
    ElementSetStore store;
    try {
        loadTLEDatabase(path, store);
    } catch (const std::exception& e) {
        error("Couldn't reload TLE database {}: {}", path, e.what());
        return false;
    }
    if (store.empty()) {
        warn("TLE database {} has no element sets, keeping the current ones.", path);
        return false;
    }
    info("Refreshed {} element sets from {}.", store.size(), path);
    session.setElementSets(std::move(store));
    return true;
}

}
