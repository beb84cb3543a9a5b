/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skywatch/catalog.hpp>

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace skywatch {
namespace {

// CelesTrak SATCAT CSV header
const std::string SATCAT_HEADER =
    "OBJECT_NAME,OBJECT_ID,NORAD_CAT_ID,OBJECT_TYPE,OPS_STATUS_CODE,OWNER,LAUNCH_DATE,"
    "LAUNCH_SITE,DECAY_DATE,PERIOD,INCLINATION,APOGEE,PERIGEE,RCS,DATA_STATUS_CODE,"
    "ORBIT_CENTER,ORBIT_TYPE\n";

const std::string ISS_ROW =
    "ISS (ZARYA),1998-067A,25544,PAY,+,ISS,1998-11-20,TYMSC,,92.84,51.63,418,414,399.0524,,EA,ORB\n";

const std::string NOAA19_ROW =
    "NOAA 19,2009-005A,33591,PAY,+,US,2009-02-06,AFWTR,,102.09,99.19,863,845,2.9417,,EA,ORB\n";

const std::string GOES16_ROW =
    "GOES 16,2016-071A,41866,PAY,+,US,2016-11-19,AFETR,,1436.1,0.08,35796,35777,,,EA,ORB\n";

CatalogStore load(const std::string& csv) {
    std::istringstream in(csv);
    return loadCatalog(in);
}

// ============================================================================
// CSV Splitting Tests
// ============================================================================

TEST(SplitCSVLineTest, PlainFields) {
    auto fields = splitCSVLine("a,b,,d");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[2], "");
    EXPECT_EQ(fields[3], "d");
}

TEST(SplitCSVLineTest, QuotedFieldWithComma) {
    auto fields = splitCSVLine("\"COSMOS 2251 DEB, A\",2,3");
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], "COSMOS 2251 DEB, A");
}

TEST(SplitCSVLineTest, EscapedQuote) {
    auto fields = splitCSVLine("\"say \"\"hi\"\"\",x");
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0], "say \"hi\"");
}

TEST(SplitCSVLineTest, TrailingCarriageReturn) {
    auto fields = splitCSVLine("a,b\r");
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[1], "b");
}

// ============================================================================
// Radar Cross Section Tests
// ============================================================================

TEST(RadarCrossSectionTest, ClampsToBounds) {
    EXPECT_DOUBLE_EQ(clampRadarCrossSection(0.1), 0.5);
    EXPECT_DOUBLE_EQ(clampRadarCrossSection(2.5), 2.5);
    EXPECT_DOUBLE_EQ(clampRadarCrossSection(399.0), 5.0);
}

TEST(RadarCrossSectionTest, NonFiniteBecomesDefault) {
    EXPECT_DOUBLE_EQ(clampRadarCrossSection(std::numeric_limits<double>::quiet_NaN()), 1.0);
}

// ============================================================================
// Catalog Loading Tests
// ============================================================================

TEST(LoadCatalogTest, ReadsSATCATRows) {
    auto catalog = load(SATCAT_HEADER + ISS_ROW + NOAA19_ROW);
    ASSERT_EQ(catalog.size(), 2u);

    const auto& noaa = catalog.at(33591);
    EXPECT_EQ(noaa.noradID, 33591);
    EXPECT_EQ(noaa.name, "NOAA 19");
    EXPECT_DOUBLE_EQ(noaa.radarCrossSection, 2.9417);
    ASSERT_TRUE(noaa.inclination.has_value());
    EXPECT_DOUBLE_EQ(*noaa.inclination, 99.19);
    ASSERT_TRUE(noaa.period.has_value());
    EXPECT_DOUBLE_EQ(*noaa.period, 102.09);
    EXPECT_EQ(noaa.designator, "2009-005A");
    EXPECT_EQ(noaa.objectType, "PAY");
    EXPECT_EQ(noaa.owner, "US");
    EXPECT_EQ(noaa.launchDate, "2009-02-06");
    EXPECT_EQ(noaa.apogee, 863.0);
    EXPECT_EQ(noaa.perigee, 845.0);
}

TEST(LoadCatalogTest, LargeCrossSectionIsClamped) {
    auto catalog = load(SATCAT_HEADER + ISS_ROW);
    EXPECT_DOUBLE_EQ(catalog.at(25544).radarCrossSection, MAX_RADAR_CROSS_SECTION);
}

TEST(LoadCatalogTest, MissingCrossSectionDefaults) {
    auto catalog = load(SATCAT_HEADER + GOES16_ROW);
    EXPECT_DOUBLE_EQ(catalog.at(41866).radarCrossSection, DEFAULT_RADAR_CROSS_SECTION);
}

TEST(LoadCatalogTest, NonNumericCrossSectionDefaults) {
    auto catalog = load("NORAD_CAT_ID,RCS\n1,SMALL\n2,0.01\n");
    EXPECT_DOUBLE_EQ(catalog.at(1).radarCrossSection, 1.0);
    EXPECT_DOUBLE_EQ(catalog.at(2).radarCrossSection, 0.5);
}

TEST(LoadCatalogTest, EveryCrossSectionInBounds) {
    auto catalog = load("NORAD_CAT_ID,RCS\n1,-4\n2,0\n3,\n4,1e9\n5,3.3\n6,nan\n");
    ASSERT_EQ(catalog.size(), 6u);
    for (const auto& [id, record] : catalog) {
        EXPECT_GE(record.radarCrossSection, MIN_RADAR_CROSS_SECTION) << id;
        EXPECT_LE(record.radarCrossSection, MAX_RADAR_CROSS_SECTION) << id;
    }
}

TEST(LoadCatalogTest, RowsWithoutIdentifierAreDropped) {
    auto catalog = load(SATCAT_HEADER + ISS_ROW +
        "MYSTERY,,abc,DEB,,,,,,,,,,,,,\n"
        "BLANK,,,DEB,,,,,,,,,,,,,\n" + NOAA19_ROW);
    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_TRUE(catalog.contains(25544));
    EXPECT_TRUE(catalog.contains(33591));
}

TEST(LoadCatalogTest, HeadersAreTrimmedAndUpperCased) {
    auto catalog = load(" norad_cat_id , Object_Name ,inclination,Period\n25544,ISS (ZARYA),51.63,92.84\n");
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.at(25544).name, "ISS (ZARYA)");
    EXPECT_EQ(catalog.at(25544).inclination, 51.63);
}

TEST(LoadCatalogTest, NonNumericOrbitDataIsAbsent) {
    auto catalog = load("NORAD_CAT_ID,INCLINATION,PERIOD\n7,unknown,\n");
    EXPECT_FALSE(catalog.at(7).inclination.has_value());
    EXPECT_FALSE(catalog.at(7).period.has_value());
}

TEST(LoadCatalogTest, QuotedNameWithComma) {
    auto catalog = load("OBJECT_NAME,NORAD_CAT_ID\n\"FENGYUN 1C DEB, X\",29999\n");
    EXPECT_EQ(catalog.at(29999).name, "FENGYUN 1C DEB, X");
}

TEST(LoadCatalogTest, DuplicateIdentifierKeepsLastRow) {
    auto catalog = load("NORAD_CAT_ID,OBJECT_NAME\n5,FIRST\n5,SECOND\n");
    ASSERT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.at(5).name, "SECOND");
}

TEST(LoadCatalogTest, ByteOrderMarkIsIgnored) {
    auto catalog = load("\xEF\xBB\xBFNORAD_CAT_ID,OBJECT_NAME\n5,FIRST\n");
    EXPECT_EQ(catalog.size(), 1u);
}

TEST(LoadCatalogTest, MissingIdentifierColumnThrows) {
    EXPECT_THROW(load("OBJECT_NAME,RCS\nISS,1.0\n"), std::runtime_error);
}

TEST(LoadCatalogTest, EmptyInputThrows) {
    EXPECT_THROW(load(""), std::runtime_error);
}

TEST(LoadCatalogTest, MissingFileThrows) {
    EXPECT_THROW(loadCatalog("/nonexistent/skywatch/satcat.csv"), std::runtime_error);
}

} // namespace
} // namespace skywatch
