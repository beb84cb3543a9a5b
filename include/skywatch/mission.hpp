/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_MISSION_HPP
#define __SKYWATCH_MISSION_HPP

#include <skywatch/catalog.hpp>

#include <iostream>
#include <string_view>

namespace skywatch {

// Orbits inclined beyond this are retrograde, typical of sun-synchronous missions (degrees)
constexpr double SUN_SYNCHRONOUS_MIN_INCLINATION = 90.0;

// Orbits slower than this are treated as geostationary (minutes)
constexpr double GEOSTATIONARY_MIN_PERIOD = 1400.0;

/**
 * Coarse orbit class guessed from catalog metadata.
 */
enum class MissionClass {
    SunSynchronous,
    Geostationary,
    LowEarthOrbit,
    Unknown
};

std::ostream& operator<<(std::ostream &os, const MissionClass &missionClass);

/**
 * Classify an object by its catalog inclination and period. The rules are
 * tried in order, each only when its value is known: inclination above 90
 * degrees, then period above 1400 minutes. A record that matches neither is
 * LowEarthOrbit when both values are known, otherwise Unknown.
 */
MissionClass classify(const CatalogRecord& record);

/**
 * Short display label, e.g. "Geostationary".
 */
std::string_view label(MissionClass missionClass);

/**
 * Likely mission, e.g. "Geostationary - Likely Communication/Weather".
 */
std::string_view describe(MissionClass missionClass);

} // namespace skywatch

#endif // __SKYWATCH_MISSION_HPP
