/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __SKYWATCH_GEODESY_HPP
#define __SKYWATCH_GEODESY_HPP

#include <chrono>
#include <cmath>

namespace skywatch {

using time_point = std::chrono::system_clock::time_point;

// Julian Date of the Unix epoch (1970-01-01 00:00:00 UTC)
constexpr double UNIX_EPOCH_JD = 2440587.5;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = M_PI / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;

// WGS84 ellipsoid constants
constexpr double WGS84_A = 6378.137;                    // Semi-major axis (km)
constexpr double WGS84_F = 1.0 / 298.257223563;         // Flattening
constexpr double WGS84_E2 = WGS84_F * (2 - WGS84_F);    // Eccentricity squared

// Altitude bounds for a valid geodetic position (km)
constexpr double MIN_ALTITUDE_KM = -50.0;
constexpr double MAX_ALTITUDE_KM = 100000.0;

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }
};

/**
 * A point above the WGS84 ellipsoid.
 */
struct GeodeticPosition {
    double latInDegrees;      ///< Geodetic latitude, [-90, 90], positive = North
    double lonInDegrees;      ///< Longitude, [-180, 180], positive = East
    double altInKilometers;   ///< Height above the ellipsoid

    bool operator==(const GeodeticPosition&) const = default;
};

/**
 * Converts a time_point to Julian Date (UTC).
 */
double toJulianDate(time_point tp);

/**
 * Minutes elapsed from one instant to another (negative if `to` is earlier).
 */
double minutesBetween(time_point from, time_point to);

/**
 * Rotates a TEME position into the Earth-fixed frame.
 *
 * @param teme Position in the True Equator Mean Equinox frame (km)
 * @param gst Greenwich sidereal angle (radians)
 */
Vec3 temeToECEF(const Vec3& teme, double gst);

/**
 * Converts ECEF coordinates (km) to WGS84 geodetic coordinates.
 */
GeodeticPosition ecefToGeodetic(const Vec3& ecef);

/**
 * Wraps a longitude in degrees into [-180, 180].
 */
double normalizeLongitude(double lonInDegrees);

} // namespace skywatch

#endif // __SKYWATCH_GEODESY_HPP
