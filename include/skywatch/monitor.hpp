/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_MONITOR_HPP
#define __SKYWATCH_MONITOR_HPP

#include <atomic>
#include <csignal>
#include <cstddef>
#include <memory>
#include <thread>
#include <utility>

#include <asio.hpp>

#include <skywatch/config.hpp>
#include <skywatch/session.hpp>

namespace skywatch {

// The current status of the monitor
enum class MonitorStatus {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING
};

/**
 * Runs tracking cycles on a timer until stopped or sent SIGINT/SIGTERM.
 *
 * Every interval the session's stores are fused and a summary is logged,
 * along with the target report when a target is configured. On the slower
 * refresh interval the TLE database is read again from disk and swapped
 * into the session. All timer work happens on the monitor's IO thread.
 */
class Monitor {
public:
    Monitor(Config config, TrackingSession &session)
        : config(std::move(config)), session(session) {}
    ~Monitor();

    MonitorStatus status();

    void start();
    void stop();
    void wait();

    /**
     * Run one tracking cycle now and log it.
     *
     * @return The number of live objects
     */
    std::size_t runCycle();

    /**
     * Reload the TLE database into the session. A database that can't be
     * read, or holds no element sets, leaves the current ones in place.
     *
     * @return True if the element sets were replaced
     */
    bool refresh();

private:
    Config config;
    TrackingSession &session;

    std::atomic<MonitorStatus> _status = MonitorStatus::STOPPED;
    std::atomic<std::size_t> cycles = 0;

    std::thread ioThread;
    asio::io_context io;
    asio::signal_set signals{io, SIGINT, SIGTERM};

    std::unique_ptr<asio::steady_timer> cycleTimer;
    std::unique_ptr<asio::steady_timer> refreshTimer;

    void initSignals();
    void scheduleCycle();
    void scheduleRefresh();
    void logTarget(int noradID, time_point asOf);
};

}

#endif
