/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skywatch/elements.hpp>

#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace skywatch {
namespace {

using namespace std::chrono;

// ISS TLE data from CelesTrak (real example)
constexpr const char* ISS_TLE =
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

// NOAA 19 TLE from CelesTrak
constexpr const char* NOAA19_TLE =
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";

// TLE with name line (three-line format)
constexpr const char* ISS_3LE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

class ElementSetTest : public ::testing::Test {
protected:
    ElementSet iss = parseElementSet(ISS_TLE);
    ElementSet noaa19 = parseElementSet(NOAA19_TLE);
};

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_F(ElementSetTest, ParseISSLine1_NoradID) {
    EXPECT_EQ(iss.getNoradID(), 25544);
}

TEST_F(ElementSetTest, ParseISSLine1_Classification) {
    EXPECT_EQ(iss.getClassification(), 'U');
}

TEST_F(ElementSetTest, ParseISSLine1_Designator) {
    EXPECT_EQ(iss.getDesignator(), "98067A");
}

TEST_F(ElementSetTest, ParseISSLine1_DragTerms) {
    EXPECT_NEAR(iss.getElements().firstDerivativeMeanMotion, 0.00008010, 1e-12);
    EXPECT_NEAR(iss.getElements().secondDerivativeMeanMotion, 0.0, 1e-12);
    EXPECT_NEAR(iss.getElements().bstarDragTerm, 0.00015237, 1e-12);
}

TEST_F(ElementSetTest, ParseISSLine1_ElementSetNumber) {
    EXPECT_EQ(iss.getElementSetNumber(), 999);
}

TEST_F(ElementSetTest, ParseISSLine2_Angles) {
    EXPECT_DOUBLE_EQ(iss.getElements().inclination, 51.6312);
    EXPECT_DOUBLE_EQ(iss.getElements().rightAscensionOfAscendingNode, 206.3646);
    EXPECT_DOUBLE_EQ(iss.getElements().argumentOfPerigee, 184.1118);
    EXPECT_DOUBLE_EQ(iss.getElements().meanAnomaly, 175.9840);
}

TEST_F(ElementSetTest, ParseISSLine2_Eccentricity) {
    // "0003723" has an implied leading decimal point
    EXPECT_NEAR(iss.getElements().eccentricity, 0.0003723, 1e-12);
}

TEST_F(ElementSetTest, ParseISSLine2_MeanMotion) {
    EXPECT_NEAR(iss.getElements().meanMotion, 15.49193835, 1e-8);
}

TEST_F(ElementSetTest, ParseISSLine2_RevolutionNumber) {
    EXPECT_EQ(iss.getRevolutionNumberAtEpoch(), 54085);
}

TEST_F(ElementSetTest, ParseNOAA19) {
    EXPECT_EQ(noaa19.getNoradID(), 33591);
    EXPECT_DOUBLE_EQ(noaa19.getElements().inclination, 98.9785);
    EXPECT_NEAR(noaa19.getElements().bstarDragTerm, 0.000052635, 1e-12);
    EXPECT_NEAR(noaa19.getElements().meanMotion, 14.13431889, 1e-8);
}

TEST_F(ElementSetTest, EpochParsing) {
    // "25333.83453771" = day 333 of 2025 = November 29, 2025 at 20:01:44.058 UTC
    auto epoch = iss.getEpoch();
    auto day = floor<days>(epoch);
    EXPECT_EQ(year_month_day{day}, year{2025}/November/29);
    auto timeOfDay = duration_cast<milliseconds>(epoch - day);
    EXPECT_NEAR(static_cast<double>(timeOfDay.count()), 72104058.0, 1.0);
}

TEST(ParseElementSetTest, TwoDigitYearBefore57IsThisCentury) {
    auto set = parseElementSet(ISS_TLE);
    EXPECT_GE(year_month_day{floor<days>(set.getEpoch())}.year(), year{2000});
}

TEST(ParseElementSetTest, TwoDigitYearFrom57IsLastCentury) {
    auto set = parseElementSet(
        "1 00005U 58002B   00179.78495062  .00000023  00000-0  28098-4 0  4753\n"
        "2 00005  34.2682 348.7242 1859667 331.7664  19.3264 10.82419157413667");
    // Epoch year "00" is 2000; designator year "58" isn't used for the epoch
    EXPECT_EQ(year_month_day{floor<days>(set.getEpoch())}.year(), year{2000});

    auto old = parseElementSet(
        "1 00005U 58002B   98179.78495062  .00000023  00000-0  28098-4 0  4753\n"
        "2 00005  34.2682 348.7242 1859667 331.7664  19.3264 10.82419157413667");
    EXPECT_EQ(year_month_day{floor<days>(old.getEpoch())}.year(), year{1998});
}

TEST(ParseElementSetTest, ThreeLineFormatName) {
    EXPECT_EQ(parseElementSet(ISS_3LE).getName(), "ISS (ZARYA)");
}

TEST(ParseElementSetTest, TwoLineFormatNamedByID) {
    EXPECT_EQ(parseElementSet(ISS_TLE).getName(), "25544");
}

TEST(ParseElementSetTest, TitleWithLeadingZero) {
    auto set = parseElementSet(std::string("0 ISS (ZARYA)\n") + ISS_TLE);
    EXPECT_EQ(set.getName(), "ISS (ZARYA)");
}

TEST(ParseElementSetTest, WindowsLineEndings) {
    auto set = parseElementSet(
        "ISS (ZARYA)\r\n"
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\r\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\r\n");
    EXPECT_EQ(set.getName(), "ISS (ZARYA)");
    EXPECT_EQ(set.getNoradID(), 25544);
}

TEST(ParseElementSetTest, MissingLine2Throws) {
    EXPECT_THROW(parseElementSet("1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993"),
                 std::invalid_argument);
}

TEST(ParseElementSetTest, TruncatedLineThrows) {
    EXPECT_THROW(parseElementSet(
        "1 25544U 98067A   25333.83453771  .00008010\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850"),
        std::invalid_argument);
}

TEST(ParseElementSetTest, GarbageFieldThrows) {
    EXPECT_THROW(parseElementSet(
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 XX.49193835540850"),
        std::invalid_argument);
}

// ============================================================================
// Validity Tests
// ============================================================================

TEST_F(ElementSetTest, RealElementSetsArePropagatable) {
    EXPECT_TRUE(iss.isPropagatable());
    EXPECT_TRUE(noaa19.isPropagatable());
}

TEST(IsPropagatableTest, RejectsDegenerateElements) {
    MeanElements elements;
    elements.meanMotion = 15.0;

    elements.eccentricity = 1.2;
    EXPECT_FALSE(ElementSet(1, "A", time_point{}, elements).isPropagatable());

    elements.eccentricity = -0.01;
    EXPECT_FALSE(ElementSet(1, "A", time_point{}, elements).isPropagatable());

    elements.eccentricity = 0.001;
    elements.meanMotion = 0.0;
    EXPECT_FALSE(ElementSet(1, "A", time_point{}, elements).isPropagatable());

    elements.meanMotion = 15.0;
    elements.inclination = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(ElementSet(1, "A", time_point{}, elements).isPropagatable());
}

TEST_F(ElementSetTest, ToSGP4ElementsConvertsUnits) {
    sgp4::Elements e = iss.toSGP4Elements();
    EXPECT_NEAR(e.inclination, 51.6312 * M_PI / 180.0, 1e-12);
    EXPECT_NEAR(e.meanMotion, 15.49193835 * 2.0 * M_PI / 1440.0, 1e-12);
    EXPECT_NEAR(e.epochJD, toJulianDate(iss.getEpoch()), 1e-9);
}

// ============================================================================
// TLE Formatting Tests
// ============================================================================

TEST(ChecksumTest, MatchesPublishedLines) {
    EXPECT_EQ(calculateChecksum("1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  999"), 3);
    EXPECT_EQ(calculateChecksum("2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.4919383554085"), 0);
    EXPECT_EQ(calculateChecksum("1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  999"), 9);
}

TEST(TLEExponentialTest, Formats) {
    EXPECT_EQ(toTLEExponential(0.0), " 00000+0");
    EXPECT_EQ(toTLEExponential(0.00015237), " 15237-3");
    EXPECT_EQ(toTLEExponential(-0.000011606), "-11606-4");
}

TEST(FirstDerivativeTest, Formats) {
    EXPECT_EQ(formatFirstDerivative(0.00008010), " .00008010");
    EXPECT_EQ(formatFirstDerivative(-0.00000023), "-.00000023");
}

TEST(GetTLETest, ReturnsLinesAsRead) {
    auto set = parseElementSet(ISS_3LE);
    EXPECT_EQ(set.getTLE(), std::string(ISS_3LE) + "\n");
}

TEST(GetTLETest, FormatsElementSetsBuiltInCode) {
    MeanElements elements;
    elements.inclination = 98.0;
    elements.rightAscensionOfAscendingNode = 10.5;
    elements.eccentricity = 0.0012345;
    elements.argumentOfPerigee = 90.25;
    elements.meanAnomaly = 270.125;
    elements.meanMotion = 14.5;
    elements.bstarDragTerm = 0.00012345;
    time_point epoch = sys_days{year{2025}/March/1} + hours{6};

    ElementSet built(42, "TESTSAT", epoch, elements);
    std::string tle = built.getTLE();

    std::istringstream lines(tle);
    std::string name, line1, line2;
    std::getline(lines, name);
    std::getline(lines, line1);
    std::getline(lines, line2);
    EXPECT_EQ(name, "TESTSAT");
    ASSERT_EQ(line1.size(), 69u);
    ASSERT_EQ(line2.size(), 69u);
    EXPECT_EQ(line1.back() - '0', calculateChecksum(line1.substr(0, 68)));
    EXPECT_EQ(line2.back() - '0', calculateChecksum(line2.substr(0, 68)));

    auto parsed = parseElementSet(tle);
    EXPECT_EQ(parsed.getNoradID(), 42);
    EXPECT_DOUBLE_EQ(parsed.getElements().inclination, 98.0);
    EXPECT_NEAR(parsed.getElements().eccentricity, 0.0012345, 1e-12);
    EXPECT_NEAR(parsed.getElements().bstarDragTerm, 0.00012345, 1e-12);
    EXPECT_NEAR(minutesBetween(parsed.getEpoch(), epoch), 0.0, 1e-4);
}

// ============================================================================
// TLE Database Tests
// ============================================================================

TEST(TLEDatabaseTest, LoadsEntriesAndSkipsMalformed) {
    std::istringstream db(
        "ISS (ZARYA)\n"
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n"
        "\n"
        "BROKEN\n"
        "1 99999U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 99999  51.6312 206.3646 0003723 184.1118 175.9840 XX.49193835540850\n"
        "NOAA 19\n"
        "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
        "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318\n");

    ElementSetStore store;
    EXPECT_EQ(loadTLEDatabase(db, store), 2);
    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.at(25544).getName(), "ISS (ZARYA)");
    EXPECT_EQ(store.at(33591).getName(), "NOAA 19");
    EXPECT_FALSE(store.contains(99999));
}

TEST(TLEDatabaseTest, LaterEntryReplacesEarlier) {
    std::istringstream db(
        "OLD NAME\n"
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n"
        "NEW NAME\n"
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n");

    ElementSetStore store;
    loadTLEDatabase(db, store);
    ASSERT_EQ(store.size(), 1u);
    EXPECT_EQ(store.at(25544).getName(), "NEW NAME");
}

TEST(TLEDatabaseTest, MissingFileLeavesStoreUnchanged) {
    ElementSetStore store;
    store.emplace(25544, parseElementSet(ISS_3LE));
    EXPECT_EQ(loadTLEDatabase("/nonexistent/skywatch/tle.txt", store), 0);
    EXPECT_EQ(store.size(), 1u);
}

TEST(TLEDatabaseTest, SaveWritesEveryEntryInOrder) {
    ElementSetStore store;
    store.emplace(33591, parseElementSet(std::string("NOAA 19\n") + NOAA19_TLE));
    store.emplace(25544, parseElementSet(ISS_3LE));

    std::ostringstream out;
    saveTLEDatabase(out, store);
    std::string text = out.str();

    auto issPos = text.find("ISS (ZARYA)");
    auto noaaPos = text.find("NOAA 19");
    ASSERT_NE(issPos, std::string::npos);
    ASSERT_NE(noaaPos, std::string::npos);
    EXPECT_LT(issPos, noaaPos);
    EXPECT_NE(text.find("2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318"), std::string::npos);

    std::istringstream in(text);
    ElementSetStore reloaded;
    EXPECT_EQ(loadTLEDatabase(in, reloaded), 2);
}

} // namespace
} // namespace skywatch
