/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skywatch/celestrak.hpp>
#include <skywatch/elements.hpp>

#include <string>
#include <vector>

namespace skywatch::celestrak {
namespace {

// Sample 3-line TLE strings for testing
const std::string ISS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n";

const std::string NOAA19_TLE =
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318\n";

// ============================================================================
// TLEResponse Tests
// ============================================================================

TEST(TLEResponseTest, DefaultConstruction) {
    TLEResponse response;
    EXPECT_TRUE(response.group.empty());
    EXPECT_TRUE(response.entries.empty());
}

TEST(TLEResponseTest, InitializerConstruction) {
    TLEResponse response{
        .group = "stations",
        .entries = { ISS_TLE, NOAA19_TLE }
    };
    EXPECT_EQ(response.group, "stations");
    ASSERT_EQ(response.entries.size(), 2u);
    EXPECT_NE(response.entries[1].find("NOAA 19"), std::string::npos);
}

// ============================================================================
// URL Tests
// ============================================================================

TEST(GroupURLTest, TLEFormatQuery) {
    EXPECT_EQ(groupURL("stations"),
              "https://celestrak.org/NORAD/elements/gp.php?GROUP=stations&FORMAT=tle");
}

TEST(GroupURLTest, DefaultGroup) {
    EXPECT_EQ(groupURL(DEFAULT_GROUP),
              "https://celestrak.org/NORAD/elements/gp.php?GROUP=active&FORMAT=tle");
}

// ============================================================================
// Response Parsing Tests
// ============================================================================

TEST(ParseTLEResponseTest, SplitsThreeLineEntries) {
    auto entries = parseTLEResponse(ISS_TLE + NOAA19_TLE);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0], ISS_TLE);
    EXPECT_EQ(entries[1], NOAA19_TLE);
}

TEST(ParseTLEResponseTest, IgnoresBlankLinesAndCarriageReturns) {
    auto entries = parseTLEResponse(
        "\r\n"
        "ISS (ZARYA)          \r\n"
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\r\n"
        "\r\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\r\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], ISS_TLE);
}

TEST(ParseTLEResponseTest, AcceptsTwoLineEntries) {
    auto entries = parseTLEResponse(
        "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
        "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850\n" +
        NOAA19_TLE);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].find("1 25544"), 0u);
    EXPECT_EQ(entries[1], NOAA19_TLE);
}

TEST(ParseTLEResponseTest, IncompleteTrailingEntryIsDropped) {
    auto entries = parseTLEResponse(ISS_TLE + "NOAA 19\n1 33591U 09005A");
    EXPECT_EQ(entries.size(), 1u);
}

TEST(ParseTLEResponseTest, EmptyResponse) {
    EXPECT_TRUE(parseTLEResponse("").empty());
    EXPECT_TRUE(parseTLEResponse("\n\n  \n").empty());
}

TEST(ParseTLEResponseTest, EntriesParseAsElementSets) {
    auto entries = parseTLEResponse(ISS_TLE + NOAA19_TLE);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(parseElementSet(entries[0]).getNoradID(), 25544);
    EXPECT_EQ(parseElementSet(entries[1]).getName(), "NOAA 19");
}

}  // namespace
}  // namespace skywatch::celestrak
