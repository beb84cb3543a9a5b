/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_TRAJECTORY_HPP
#define __SKYWATCH_TRAJECTORY_HPP

#include <skywatch/elements.hpp>
#include <skywatch/propagator.hpp>

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace skywatch {

// Default ground track window: 100 minutes ahead, one sample every 4 minutes
constexpr double DEFAULT_HORIZON_MINUTES = 100.0;
constexpr double DEFAULT_STEP_MINUTES = 4.0;

// Most samples collect() reserves space for up front
constexpr std::size_t MAX_RESERVED_TRACK_SAMPLES = 1'000'000;

/**
 * Raised when a sampling window is not usable: the step must be positive
 * and the horizon non-negative, both finite, with every sample time inside
 * the clock's range.
 */
class InvalidSamplingWindow : public std::invalid_argument {
public:
    explicit InvalidSamplingWindow(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * One sample of a ground track.
 */
struct TrackPoint {
    double latInDegrees;
    double lonInDegrees;

    bool operator==(const TrackPoint&) const = default;
};

/**
 * Horizon and step for a ground track, in minutes.
 */
struct TrackOptions {
    double horizonMinutes = DEFAULT_HORIZON_MINUTES;
    double stepMinutes = DEFAULT_STEP_MINUTES;
};

/**
 * The predicted ground track of one object.
 *
 * Sample k is the sub-satellite point at start + k * step, for
 * k = 0 .. floor(horizon / step) - 1. Nothing is computed until a sample is
 * read, and each read is an independent propagation, so the track can be
 * iterated any number of times and always yields the same points.
 */
class GroundTrack {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::input_iterator_tag;
        using value_type = TrackPoint;
        using difference_type = std::ptrdiff_t;
        using reference = TrackPoint;

        iterator() = default;

        /**
         * @throws PropagationError if the model fails at this sample
         */
        TrackPoint operator*() const { return track->at(index); }

        iterator& operator++() {
            ++index;
            return *this;
        }

        void operator++(int) { ++index; }

        bool operator==(const iterator& other) const { return index == other.index; }

    private:
        friend class GroundTrack;
        iterator(const GroundTrack* track, std::size_t index) : track(track), index(index) {}

        const GroundTrack* track = nullptr;
        std::size_t index = 0;
    };

    /**
     * @throws InvalidSamplingWindow if the window is not usable
     * @throws DegenerateElementSet if the element set is unusable
     */
    GroundTrack(const ElementSet& elementSet, time_point start,
                double horizonMinutes, double stepMinutes);

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, count); }

    std::size_t size() const { return count; }
    bool empty() const { return count == 0; }

    /**
     * Sample k, computed on demand.
     *
     * @throws std::out_of_range if k >= size()
     * @throws PropagationError if the model fails at this sample
     */
    TrackPoint at(std::size_t k) const;

    /**
     * Instant of sample k.
     *
     * @throws std::out_of_range if the instant is past the end of the clock
     */
    time_point timeAt(std::size_t k) const;

    /**
     * Compute every sample. Checks the stop token before each sample and
     * returns the samples computed so far once a stop is requested. If the
     * model fails at a sample (the object has decayed, say) the samples
     * before it are returned.
     */
    std::vector<TrackPoint> collect(std::stop_token stop = {}) const;

    int getNoradID() const { return propagator.getNoradID(); }
    time_point getStart() const { return start; }
    double getStepMinutes() const { return stepMinutes; }

private:
    std::size_t count;
    time_point start;
    double stepMinutes;
    Propagator propagator;
};

/**
 * Number of samples in a window, floor(horizon / step).
 *
 * @throws InvalidSamplingWindow if the step or horizon is not usable, or the
 *         count doesn't fit in a size_t
 */
std::size_t sampleCount(double horizonMinutes, double stepMinutes);

/**
 * Ground track of an element set from a start time.
 *
 * @throws InvalidSamplingWindow if the window is not usable
 * @throws DegenerateElementSet if the element set is unusable
 */
GroundTrack sampleTrack(const ElementSet& elementSet, time_point start,
                        double horizonMinutes = DEFAULT_HORIZON_MINUTES,
                        double stepMinutes = DEFAULT_STEP_MINUTES);

} // namespace skywatch

#endif // __SKYWATCH_TRAJECTORY_HPP
