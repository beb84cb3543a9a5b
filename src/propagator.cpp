/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/propagator.hpp>

#include <cmath>

#include <spdlog/fmt/fmt.h>

namespace skywatch {

sgp4::Model Propagator::initializeModel(const ElementSet& elementSet) {
    if (!elementSet.isPropagatable()) {
        const MeanElements& e = elementSet.getElements();
        throw DegenerateElementSet(elementSet.getNoradID(), fmt::format(
            "Degenerate element set for {}: eccentricity {}, mean motion {} rev/day",
            elementSet.getNoradID(), e.eccentricity, e.meanMotion));
    }
    try {
        return sgp4::Model(elementSet.toSGP4Elements());
    } catch (const sgp4::SGP4Exception& e) {
        throw PropagationError(elementSet.getNoradID(), fmt::format(
            "Can't initialize SGP4 for {}: {}", elementSet.getNoradID(), e.what()));
    }
}

Propagator::Propagator(const ElementSet& elementSet)
    : noradID(elementSet.getNoradID()),
      epoch(elementSet.getEpoch()),
      model(initializeModel(elementSet)) {}

sgp4::StateVector Propagator::stateAt(time_point t) const {
    try {
        return model.propagate(minutesBetween(epoch, t));
    } catch (const sgp4::SGP4Exception& e) {
        throw PropagationError(noradID, fmt::format("Propagation failed for {}: {}", noradID, e.what()));
    }
}

GeodeticPosition Propagator::positionAt(time_point t) const {
    sgp4::StateVector state = stateAt(t);
    Vec3 teme{state.r[0], state.r[1], state.r[2]};
    Vec3 ecef = temeToECEF(teme, sgp4::gstime(toJulianDate(t)));
    GeodeticPosition position = ecefToGeodetic(ecef);

    if (!std::isfinite(position.latInDegrees) || !std::isfinite(position.lonInDegrees)
        || !std::isfinite(position.altInKilometers)) {
        throw PropagationError(noradID, fmt::format("Propagation for {} produced a non-finite position", noradID));
    }
    if (position.altInKilometers < MIN_ALTITUDE_KM || position.altInKilometers >= MAX_ALTITUDE_KM) {
        throw PropagationError(noradID, fmt::format(
            "Altitude {:.1f} km for {} is outside the valid range", position.altInKilometers, noradID));
    }
    return position;
}

GeodeticPosition propagate(const ElementSet& elementSet, time_point targetTime) {
    return Propagator(elementSet).positionAt(targetTime);
}

} // namespace skywatch
