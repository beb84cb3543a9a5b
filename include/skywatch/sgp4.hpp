/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * SGP4/SDP4 Satellite Propagation Module
 * Based on the Vallado reference implementation from CelesTrak.
 * See: https://celestrak.org/software/vallado-sw.php
 */

#ifndef __SKYWATCH_SGP4_HPP
#define __SKYWATCH_SGP4_HPP

#include <cmath>
#include <stdexcept>
#include <string>

namespace skywatch::sgp4 {

// ============================================================================
// SGP4 Constants
// ============================================================================

// WGS-72 constants, as used to generate the published element sets
constexpr double MU = 398600.8;                    // Earth gravitational parameter (km^3/s^2)
constexpr double RADIUS_EARTH_KM = 6378.135;       // Earth equatorial radius (km)
constexpr double J2 = 0.001082616;                 // Second gravitational zonal harmonic
constexpr double J3 = -0.00000253881;              // Third gravitational zonal harmonic
constexpr double J4 = -0.00000165597;              // Fourth gravitational zonal harmonic
constexpr double J3OJ2 = J3 / J2;
constexpr double XKE = 0.0743669161331734132;      // sqrt(GM) in Earth radii^1.5/min
constexpr double TUMIN = 1.0 / XKE;                // Minutes per time unit
constexpr double VKMPERSEC = RADIUS_EARTH_KM * XKE / 60.0;  // km/s per velocity unit
constexpr double TWO_PI = 2.0 * M_PI;
constexpr double X2O3 = 2.0 / 3.0;
constexpr double MINUTES_PER_DAY = 1440.0;

// Orbits with a period of at least this many minutes use the deep-space terms
constexpr double DEEP_SPACE_PERIOD_MINUTES = 225.0;

// ============================================================================
// SGP4 Exception Classes
// ============================================================================

/**
 * Base exception class for SGP4 propagation errors.
 */
class SGP4Exception : public std::runtime_error {
public:
    explicit SGP4Exception(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a satellite has decayed (re-entered atmosphere).
 */
class SatelliteDecayedException : public SGP4Exception {
public:
    SatelliteDecayedException() : SGP4Exception("Satellite has decayed") {}
};

/**
 * Exception thrown when the mean or perturbed elements leave the range the
 * model can handle.
 */
class InvalidOrbitException : public SGP4Exception {
public:
    explicit InvalidOrbitException(const std::string& msg) : SGP4Exception(msg) {}
};

// ============================================================================
// SGP4 Data Structures
// ============================================================================

/**
 * Mean elements from a TLE, in the units the model works in.
 */
struct Elements {
    double epochJD;            // Epoch as Julian Date (UTC)
    double bstar;              // BSTAR drag term (1/earth radii)
    double inclination;        // Inclination (radians)
    double raan;               // Right ascension of ascending node (radians)
    double eccentricity;       // Eccentricity
    double argPerigee;         // Argument of perigee (radians)
    double meanAnomaly;        // Mean anomaly (radians)
    double meanMotion;         // Kozai mean motion (radians/minute)
};

/**
 * Position and velocity in the True Equator Mean Equinox (TEME) frame.
 */
struct StateVector {
    double r[3];  // Position (km)
    double v[3];  // Velocity (km/s)
};

/**
 * Secular and drag coefficients shared by SGP4 and SDP4.
 */
struct NearEarthTerms {
    bool simpleDrag = false;      // Perigee below 220 km: drop the higher order drag terms
    double a = 0.0;               // Semi-major axis (earth radii)
    double aycof = 0.0;
    double xlcof = 0.0;
    double con41 = 0.0;
    double x1mth2 = 0.0;
    double x7thm1 = 0.0;
    double cc1 = 0.0, cc4 = 0.0, cc5 = 0.0;
    double d2 = 0.0, d3 = 0.0, d4 = 0.0;
    double delmo = 0.0;
    double eta = 0.0;
    double sinmao = 0.0;
    double omgcof = 0.0;
    double xmcof = 0.0;
    double nodecf = 0.0;
    double t2cof = 0.0, t3cof = 0.0, t4cof = 0.0, t5cof = 0.0;
    double mdot = 0.0;            // Secular rate of mean anomaly (rad/min)
    double argpdot = 0.0;         // Secular rate of argument of perigee (rad/min)
    double nodedot = 0.0;         // Secular rate of the node (rad/min)
};

/**
 * Periodic perturbation coefficients of one third body (dscom).
 */
struct PeriodicTerms {
    double e2 = 0.0, e3 = 0.0;
    double i2 = 0.0, i3 = 0.0;
    double l2 = 0.0, l3 = 0.0, l4 = 0.0;
    double gh2 = 0.0, gh3 = 0.0, gh4 = 0.0;
    double h2 = 0.0, h3 = 0.0;
};

/**
 * Lunar-solar periodics (dpper).
 */
struct LunarSolarTerms {
    double zmos = 0.0;            // Solar mean anomaly at epoch
    double zmol = 0.0;            // Lunar mean anomaly at epoch
    PeriodicTerms sun;
    PeriodicTerms moon;
};

/**
 * Deep-space secular rates and geopotential resonance coefficients (dsinit).
 */
struct ResonanceTerms {
    int kind = 0;                 // 0 = none, 1 = synchronous (24h), 2 = half-day (12h)
    double dedt = 0.0, didt = 0.0, dmdt = 0.0, dnodt = 0.0, domdt = 0.0;
    double del1 = 0.0, del2 = 0.0, del3 = 0.0;
    double d2201 = 0.0, d2211 = 0.0;
    double d3210 = 0.0, d3222 = 0.0;
    double d4410 = 0.0, d4422 = 0.0;
    double d5220 = 0.0, d5232 = 0.0, d5421 = 0.0, d5433 = 0.0;
    double xfact = 0.0;
    double xlamo = 0.0;
};

// ============================================================================
// SGP4 Model
// ============================================================================

/**
 * An initialized SGP4/SDP4 model for one set of mean elements.
 *
 * The model is immutable after construction. The deep-space resonance
 * integrator restarts from epoch on every call, so propagate() has no
 * hidden state and the same input always gives the same output. A single
 * instance may be shared between threads.
 */
class Model {
public:
    /**
     * Initialize the model (sgp4init).
     *
     * @param elements Mean elements; eccentricity must be in [0, 1) and
     *                 mean motion positive
     * @throws InvalidOrbitException if the elements can't be initialized
     */
    explicit Model(const Elements& elements);

    /**
     * Propagate to a time offset from epoch.
     *
     * @param tsince Minutes since epoch (may be negative)
     * @return TEME position and velocity
     * @throws InvalidOrbitException if the perturbed elements become invalid
     * @throws SatelliteDecayedException if the satellite is below the surface
     */
    StateVector propagate(double tsince) const;

    bool isDeepSpace() const { return deepSpace; }
    double getEpochJulianDate() const { return epochJD; }
    double getSemiMajorAxis() const { return near.a; }
    double getUnKozaiMeanMotion() const { return noUnkozai; }

private:
    // Epoch and mean elements at epoch
    double epochJD = 0.0;
    double bstar = 0.0;
    double ecco = 0.0;
    double inclo = 0.0;
    double nodeo = 0.0;
    double argpo = 0.0;
    double mo = 0.0;
    double noUnkozai = 0.0;       // Brouwer mean motion (rad/min)
    double gsto = 0.0;            // Greenwich sidereal angle at epoch (rad)

    bool deepSpace = false;
    NearEarthTerms near;
    LunarSolarTerms lunarSolar;
    ResonanceTerms resonance;

    void initializeDeepSpace(double sinim, double cosim);
    void applyDeepSpaceSecular(double t, double& em, double& argpm, double& inclm,
                               double& nodem, double& mm, double& nm) const;
    void applyLunarSolarPeriodics(double t, double& ep, double& inclp, double& nodep,
                                  double& argpp, double& mp) const;
};

/**
 * Greenwich sidereal angle (IAU 1982 model) at a UT1 Julian Date.
 * @return Angle in radians, normalized to [0, 2π)
 */
double gstime(double jdut1);

} // namespace skywatch::sgp4

#endif // __SKYWATCH_SGP4_HPP
