/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 *
 * Two-line element sets and the local TLE database.
 */

#ifndef __SKYWATCH_ELEMENTS_HPP
#define __SKYWATCH_ELEMENTS_HPP

#include <skywatch/geodesy.hpp>
#include <skywatch/sgp4.hpp>

#include <iosfwd>
#include <map>
#include <string>
#include <string_view>

namespace skywatch {

/**
 * Mean orbital elements as published in a TLE.
 */
struct MeanElements {
    double inclination = 0.0;                   ///< degrees
    double rightAscensionOfAscendingNode = 0.0; ///< degrees
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;             ///< degrees
    double meanAnomaly = 0.0;                   ///< degrees
    double meanMotion = 0.0;                    ///< revolutions per day
    double firstDerivativeMeanMotion = 0.0;     ///< rev/day^2 / 2
    double secondDerivativeMeanMotion = 0.0;    ///< rev/day^3 / 6
    double bstarDragTerm = 0.0;                 ///< 1/earth radii
};

/**
 * One orbital element set for a tracked object.
 *
 * Element sets are immutable. A refresh replaces the whole set rather than
 * updating it in place.
 */
class ElementSet {
public:
    ElementSet() = default;
    ElementSet(int noradID, std::string name, time_point epoch, const MeanElements& elements);

    int getNoradID() const { return noradID; }
    const std::string& getName() const { return name; }
    char getClassification() const { return classification; }
    const std::string& getDesignator() const { return designator; }
    time_point getEpoch() const { return epoch; }
    const MeanElements& getElements() const { return elements; }
    int getElementSetNumber() const { return elementSetNumber; }
    int getRevolutionNumberAtEpoch() const { return revolutionNumberAtEpoch; }

    /**
     * True if every element is finite, eccentricity is in [0, 1) and mean
     * motion is positive.
     */
    bool isPropagatable() const;

    /**
     * Elements converted to the units the SGP4 model expects.
     */
    sgp4::Elements toSGP4Elements() const;

    /**
     * Standard 3-line TLE. The lines read from the source are returned
     * unchanged; element sets built in code are formatted on demand.
     */
    std::string getTLE() const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

private:
    int noradID = 0;
    std::string name;
    char classification = 'U';
    std::string designator;
    time_point epoch;
    MeanElements elements;
    int elementSetNumber = 0;
    int revolutionNumberAtEpoch = 0;

    // Raw lines as read, empty for element sets built in code
    std::string line1;
    std::string line2;

    friend ElementSet parseElementSet(std::string_view tle);
};

using ElementSetStore = std::map<int, ElementSet>;

/**
 * Parse a two- or three-line TLE. A line that precedes line 1 is the name.
 *
 * @throws std::invalid_argument if either element line is missing or malformed
 */
ElementSet parseElementSet(std::string_view tle);

// ============================================================================
// TLE Database Functions
// ============================================================================

/**
 * Load element sets in 3-line TLE format into a store, replacing entries with
 * the same NORAD ID. Malformed entries are logged and skipped. A missing file
 * leaves the store unchanged.
 *
 * @return Number of element sets loaded
 * @throws std::runtime_error if an existing file can't be opened
 */
int loadTLEDatabase(std::istream &s, ElementSetStore &store);
int loadTLEDatabase(const std::string &filepath, ElementSetStore &store);

/**
 * Write every element set in 3-line TLE format.
 *
 * @throws std::runtime_error if the file can't be opened for writing
 */
void saveTLEDatabase(std::ostream &s, const ElementSetStore &store);
void saveTLEDatabase(const std::string &filepath, const ElementSetStore &store);

// TLE formatting utilities
int calculateChecksum(std::string_view line);
std::string toTLEExponential(double value);
std::string formatFirstDerivative(double value);

} // namespace skywatch

#endif // __SKYWATCH_ELEMENTS_HPP
