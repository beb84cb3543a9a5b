/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Static metadata for known objects, loaded from a SATCAT-style CSV file.
 * See: https://celestrak.org/satcat/satcat-format.php
 */

#ifndef __SKYWATCH_CATALOG_HPP
#define __SKYWATCH_CATALOG_HPP

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skywatch {

// Bounds and default for the radar cross section size proxy (m^2)
constexpr double MIN_RADAR_CROSS_SECTION = 0.5;
constexpr double MAX_RADAR_CROSS_SECTION = 5.0;
constexpr double DEFAULT_RADAR_CROSS_SECTION = 1.0;

/**
 * Catalog metadata for one object.
 */
struct CatalogRecord {
    int noradID = 0;
    std::string name;
    double radarCrossSection = DEFAULT_RADAR_CROSS_SECTION;  ///< Always within [0.5, 5.0]
    std::optional<double> inclination;        ///< degrees
    std::optional<double> period;             ///< minutes

    std::optional<std::string> designator;    ///< International designator (OBJECT_ID)
    std::optional<std::string> objectType;    ///< PAY, R/B, DEB, UNK
    std::optional<std::string> owner;
    std::optional<std::string> launchDate;
    std::optional<double> apogee;             ///< km
    std::optional<double> perigee;            ///< km
};

using CatalogStore = std::map<int, CatalogRecord>;

/**
 * Clamp a radar cross section into the catalog's bounded range. A value that
 * isn't a finite number becomes the default.
 */
double clampRadarCrossSection(double rcs);

/**
 * Split one CSV line into fields. Double quotes group a field that contains
 * commas, and a doubled quote inside a quoted field is a literal quote.
 */
std::vector<std::string> splitCSVLine(std::string_view line);

/**
 * Load a SATCAT CSV file.
 *
 * Header names are matched case-insensitively. Rows whose NORAD_CAT_ID is
 * not an integer are dropped. A missing or non-numeric RCS becomes 1.0 and
 * every RCS is clamped to [0.5, 5.0]. Non-numeric INCLINATION and PERIOD
 * values are left absent. When an identifier repeats, the last row wins.
 *
 * @throws std::runtime_error if the file can't be read or has no
 *         NORAD_CAT_ID column
 */
CatalogStore loadCatalog(std::istream &s);
CatalogStore loadCatalog(const std::string &filepath);

} // namespace skywatch

#endif // __SKYWATCH_CATALOG_HPP
