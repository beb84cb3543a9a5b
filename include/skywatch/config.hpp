/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_CONFIG_HPP
#define __SKYWATCH_CONFIG_HPP

#include <skywatch/geodesy.hpp>

#include <optional>
#include <string>

namespace skywatch {

constexpr unsigned int MAX_THREADS = 64;

class Config {
public:
    Config() = default;
    ~Config() = default;

    std::string getCatalogPath() const;
    void setCatalogPath(const std::string &path);

    std::string getTLEPath() const;
    void setTLEPath(const std::string &path);

    // Current time unless a fixed time has been set
    time_point getTime() const;
    void setTime(const time_point tp);
    void clearTime();
    bool hasTime() const;

    double getHorizonMinutes() const;
    void setHorizonMinutes(const double minutes);

    double getStepMinutes() const;
    void setStepMinutes(const double minutes);

    // Between 1 and MAX_THREADS
    unsigned int getThreads() const;
    void setThreads(const int threads);

    // Between 1 second and 1 hour
    int getIntervalSeconds() const;
    void setIntervalSeconds(const int seconds);

    // Between 1 minute and 1 day
    int getRefreshMinutes() const;
    void setRefreshMinutes(const int minutes);

    std::optional<int> getTarget() const;
    void setTarget(const int noradID);
    void clearTarget();

    bool getVerbose() const;
    void setVerbose(bool);

private:
    std::string catalogPath = "satcat.csv";
    std::string tlePath = "tle.txt";
    std::optional<time_point> time;
    double horizonMinutes = 100.0;
    double stepMinutes = 4.0;
    unsigned int threads = 1;
    int intervalSeconds = 10;
    int refreshMinutes = 60;
    std::optional<int> target;
    bool verbose = false;
};

}

#endif
