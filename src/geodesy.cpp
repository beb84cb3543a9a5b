/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <skywatch/geodesy.hpp>

#include <chrono>
#include <cmath>

namespace skywatch {

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

double minutesBetween(time_point from, time_point to) {
    using namespace std::chrono;
    return duration_cast<duration<double, minutes::period>>(to - from).count();
}

// Rotate about the Z axis by the Greenwich sidereal angle
Vec3 temeToECEF(const Vec3& teme, double gst) {
    double cosGST = std::cos(gst);
    double sinGST = std::sin(gst);

    return {
         teme.x * cosGST + teme.y * sinGST,
        -teme.x * sinGST + teme.y * cosGST,
         teme.z
    };
}

// Convert ECEF coordinates to geodetic latitude, longitude, and altitude
GeodeticPosition ecefToGeodetic(const Vec3& ecef) {
    double x = ecef.x, y = ecef.y, z = ecef.z;
    double lon = std::atan2(y, x);
    double p = std::sqrt(x*x + y*y);

    // Iterative latitude calculation (Bowring's method)
    double lat = std::atan2(z, p * (1 - WGS84_E2));
    for (int i = 0; i < 10; ++i) {
        double sinLat = std::sin(lat);
        double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);
        lat = std::atan2(z + WGS84_E2 * N * sinLat, p);
    }

    // This form stays well conditioned over the poles, where cos(lat) -> 0
    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double alt = p * cosLat + z * sinLat - WGS84_A * std::sqrt(1 - WGS84_E2 * sinLat * sinLat);

    return {lat * RADIANS_TO_DEGREES, normalizeLongitude(lon * RADIANS_TO_DEGREES), alt};
}

double normalizeLongitude(double lonInDegrees) {
    double lon = std::fmod(lonInDegrees + 180.0, 360.0);
    if (lon < 0) lon += 360.0;
    lon -= 180.0;
    // Keep +180 as +180 instead of folding it to -180
    if (lon == -180.0 && lonInDegrees > 0) lon = 180.0;
    return lon;
}

} // namespace skywatch
