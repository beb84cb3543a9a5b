/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/trajectory.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;
using spdlog::warn;

namespace skywatch {

namespace {

using FractionalMinutes = std::chrono::duration<double, std::chrono::minutes::period>;

// Largest offset from start that still lands inside the clock's range, less a minute of slack
double minutesLeftOnClock(time_point start) {
    return FractionalMinutes(time_point::max().time_since_epoch()).count()
        - FractionalMinutes(start.time_since_epoch()).count() - 1.0;
}

std::size_t checkedSampleCount(time_point start, double horizonMinutes, double stepMinutes) {
    std::size_t count = sampleCount(horizonMinutes, stepMinutes);
    if (count > 0 && static_cast<double>(count - 1) * stepMinutes > minutesLeftOnClock(start)) {
        throw InvalidSamplingWindow(fmt::format(
            "Window of {} minutes every {} minutes runs past the end of the clock", horizonMinutes, stepMinutes));
    }
    return count;
}

} // namespace

std::size_t sampleCount(double horizonMinutes, double stepMinutes) {
    if (!std::isfinite(stepMinutes) || stepMinutes <= 0.0) {
        throw InvalidSamplingWindow(fmt::format("Step must be a positive number of minutes, got {}", stepMinutes));
    }
    if (!std::isfinite(horizonMinutes) || horizonMinutes < 0.0) {
        throw InvalidSamplingWindow(fmt::format("Horizon must be a non-negative number of minutes, got {}", horizonMinutes));
    }

    double samples = std::floor(horizonMinutes / stepMinutes);
    if (samples >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        throw InvalidSamplingWindow(fmt::format(
            "Window of {} minutes every {} minutes has too many samples to count", horizonMinutes, stepMinutes));
    }
    return static_cast<std::size_t>(samples);
}

GroundTrack::GroundTrack(const ElementSet& elementSet, time_point start,
                         double horizonMinutes, double stepMinutes)
    : count(checkedSampleCount(start, horizonMinutes, stepMinutes)),
      start(start),
      stepMinutes(stepMinutes),
      propagator(elementSet) {}

time_point GroundTrack::timeAt(std::size_t k) const {
    double offset = static_cast<double>(k) * stepMinutes;
    if (offset > minutesLeftOnClock(start)) {
        throw std::out_of_range(fmt::format("Sample {} is past the end of the clock", k));
    }
    return start + std::chrono::duration_cast<time_point::duration>(FractionalMinutes(offset));
}

TrackPoint GroundTrack::at(std::size_t k) const {
    if (k >= count) {
        throw std::out_of_range(fmt::format("Sample {} is past the end of a {} sample track", k, count));
    }
    GeodeticPosition position = propagator.positionAt(timeAt(k));
    return {position.latInDegrees, position.lonInDegrees};
}

std::vector<TrackPoint> GroundTrack::collect(std::stop_token stop) const {
    std::vector<TrackPoint> points;
    points.reserve(std::min(count, MAX_RESERVED_TRACK_SAMPLES));
    for (std::size_t k = 0; k < count; ++k) {
        if (stop.stop_requested()) {
            debug("Ground track for {} stopped after {} of {} samples", getNoradID(), k, count);
            break;
        }
        try {
            points.push_back(at(k));
        } catch (const PropagationError& e) {
            warn("Ground track for {} ends after {} of {} samples: {}", getNoradID(), k, count, e.what());
            break;
        }
    }
    return points;
}

GroundTrack sampleTrack(const ElementSet& elementSet, time_point start,
                        double horizonMinutes, double stepMinutes) {
    return GroundTrack(elementSet, start, horizonMinutes, stepMinutes);
}

} // namespace skywatch
