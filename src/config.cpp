/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/config.hpp>

#include <algorithm>

namespace skywatch {

std::string Config::getCatalogPath() const {
    return catalogPath;
}

void Config::setCatalogPath(const std::string &path) {
    catalogPath = path;
}

std::string Config::getTLEPath() const {
    return tlePath;
}

void Config::setTLEPath(const std::string &path) {
    tlePath = path;
}

time_point Config::getTime() const {
    return time.value_or(std::chrono::system_clock::now());
}

void Config::setTime(const time_point tp) {
    time = tp;
}

void Config::clearTime() {
    time.reset();
}

bool Config::hasTime() const {
    return time.has_value();
}

// The sampling window is checked where it's used, so these are stored as given
double Config::getHorizonMinutes() const {
    return horizonMinutes;
}

void Config::setHorizonMinutes(const double minutes) {
    horizonMinutes = minutes;
}

double Config::getStepMinutes() const {
    return stepMinutes;
}

void Config::setStepMinutes(const double minutes) {
    stepMinutes = minutes;
}

unsigned int Config::getThreads() const {
    return threads;
}

void Config::setThreads(const int t) {
    if (t < 1) {
        threads = 1;
    } else if (t > static_cast<int>(MAX_THREADS)) {
        threads = MAX_THREADS;
    } else {
        threads = static_cast<unsigned int>(t);
    }
}

int Config::getIntervalSeconds() const {
    return intervalSeconds;
}

void Config::setIntervalSeconds(const int seconds) {
    intervalSeconds = std::clamp(seconds, 1, 3600);
}

int Config::getRefreshMinutes() const {
    return refreshMinutes;
}

void Config::setRefreshMinutes(const int minutes) {
    refreshMinutes = std::clamp(minutes, 1, 1440);
}

std::optional<int> Config::getTarget() const {
    return target;
}

void Config::setTarget(const int noradID) {
    target = noradID;
}

void Config::clearTarget() {
    target.reset();
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

}
