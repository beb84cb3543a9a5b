/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_PROPAGATOR_HPP
#define __SKYWATCH_PROPAGATOR_HPP

#include <skywatch/elements.hpp>
#include <skywatch/geodesy.hpp>
#include <skywatch/sgp4.hpp>

#include <stdexcept>
#include <string>

namespace skywatch {

/**
 * Raised when an element set can't be propagated to the requested time.
 */
class PropagationError : public std::runtime_error {
public:
    PropagationError(int noradID, const std::string& msg)
        : std::runtime_error(msg), noradID(noradID) {}

    int getNoradID() const { return noradID; }

private:
    int noradID;
};

/**
 * Raised before any computation when an element set is unusable: an element
 * is not finite, eccentricity is outside [0, 1) or mean motion is not
 * positive.
 */
class DegenerateElementSet : public PropagationError {
public:
    using PropagationError::PropagationError;
};

/**
 * Computes geodetic positions for one element set.
 *
 * The SGP4 model is initialized once on construction, so evaluating the
 * same element set at many instants is cheap. Evaluation is const and
 * thread-safe.
 */
class Propagator {
public:
    /**
     * @throws DegenerateElementSet if the element set is unusable
     * @throws PropagationError if the model can't be initialized
     */
    explicit Propagator(const ElementSet& elementSet);

    /**
     * Position at an instant, which may be before or after epoch.
     *
     * @throws PropagationError if the model fails at that instant or the
     *         result falls outside the valid geodetic range
     */
    GeodeticPosition positionAt(time_point t) const;

    /**
     * TEME state vector at an instant.
     */
    sgp4::StateVector stateAt(time_point t) const;

    int getNoradID() const { return noradID; }
    bool isDeepSpace() const { return model.isDeepSpace(); }

private:
    int noradID;
    time_point epoch;
    sgp4::Model model;

    static sgp4::Model initializeModel(const ElementSet& elementSet);
};

/**
 * Geodetic position of an element set at a target time. Pure: the same
 * arguments always give the same position.
 *
 * @throws DegenerateElementSet if the element set is unusable
 * @throws PropagationError if the model fails at that instant
 */
GeodeticPosition propagate(const ElementSet& elementSet, time_point targetTime);

} // namespace skywatch

#endif // __SKYWATCH_PROPAGATOR_HPP
