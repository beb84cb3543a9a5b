/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/mission.hpp>

#include <cmath>
#include <optional>

namespace skywatch {

namespace {

bool isKnown(const std::optional<double>& value) {
    return value.has_value() && !std::isnan(*value);
}

} // namespace

MissionClass classify(const CatalogRecord& record) {
    const bool knownInclination = isKnown(record.inclination);
    const bool knownPeriod = isKnown(record.period);

    if (knownInclination && *record.inclination > SUN_SYNCHRONOUS_MIN_INCLINATION) {
        return MissionClass::SunSynchronous;
    }
    if (knownPeriod && *record.period > GEOSTATIONARY_MIN_PERIOD) {
        return MissionClass::Geostationary;
    }
    // LEO only when both values rule out the other classes
    if (!knownInclination || !knownPeriod) {
        return MissionClass::Unknown;
    }
    return MissionClass::LowEarthOrbit;
}

std::string_view label(MissionClass missionClass) {
    switch (missionClass) {
        case MissionClass::SunSynchronous:
            return "Sun-Synchronous (Polar)";
        case MissionClass::Geostationary:
            return "Geostationary";
        case MissionClass::LowEarthOrbit:
            return "Low Earth Orbit (LEO)";
        case MissionClass::Unknown:
            break;
    }
    return "Unknown";
}

std::string_view describe(MissionClass missionClass) {
    switch (missionClass) {
        case MissionClass::SunSynchronous:
            return "Sun-Synchronous (Polar) - Likely Imaging/Remote Sensing";
        case MissionClass::Geostationary:
            return "Geostationary - Likely Communication/Weather";
        case MissionClass::LowEarthOrbit:
            return "Low Earth Orbit (LEO) - Likely Scientific/Experimental";
        case MissionClass::Unknown:
            break;
    }
    return "Unknown - Insufficient orbital data";
}

std::ostream& operator<<(std::ostream &os, const MissionClass &missionClass) {
    return os << label(missionClass);
}

} // namespace skywatch
