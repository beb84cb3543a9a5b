/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <skywatch/trajectory.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace skywatch {
namespace {

using namespace std::chrono;

constexpr const char* ISS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

class GroundTrackTest : public ::testing::Test {
protected:
    ElementSet iss = parseElementSet(ISS_TLE);
    time_point start = iss.getEpoch() + minutes{30};
};

ElementSet degenerate() {
    MeanElements elements;
    elements.eccentricity = 1.2;
    elements.meanMotion = 15.0;
    return ElementSet(9, "DEGENERATE", time_point{}, elements);
}

// A 270 km orbit with enough drag to re-enter about 40 minutes after epoch
ElementSet reentering() {
    MeanElements elements;
    elements.inclination = 98.0;
    elements.eccentricity = 0.005;
    elements.meanMotion = 16.0;
    elements.bstarDragTerm = 0.8;
    return ElementSet(77, "REENTERING", sys_days{year{2025}/January/1}, elements);
}

// Minutes from start to the end of the clock's range
double minutesOfClockLeft(time_point start) {
    return duration<double, minutes::period>(time_point::max().time_since_epoch()).count()
        - duration<double, minutes::period>(start.time_since_epoch()).count();
}

// ============================================================================
// Sample Count Tests
// ============================================================================

TEST(SampleCountTest, FloorOfHorizonOverStep) {
    EXPECT_EQ(sampleCount(100.0, 4.0), 25u);
    EXPECT_EQ(sampleCount(10.0, 3.0), 3u);
    EXPECT_EQ(sampleCount(90.0, 1.0), 90u);
}

TEST(SampleCountTest, ZeroHorizonIsEmpty) {
    EXPECT_EQ(sampleCount(0.0, 4.0), 0u);
}

TEST(SampleCountTest, HorizonShorterThanStepIsEmpty) {
    EXPECT_EQ(sampleCount(3.0, 4.0), 0u);
}

TEST(SampleCountTest, HorizonJustShortOfAStepIsNotRoundedUp) {
    EXPECT_EQ(sampleCount(0.9999999999, 1.0), 0u);
    EXPECT_EQ(sampleCount(99.999999, 4.0), 24u);
}

TEST(SampleCountTest, FloorOfTheComputedRatio) {
    // 0.3 / 0.1 is 2.9999999999999996 in binary floating point
    EXPECT_EQ(sampleCount(0.3, 0.1), 2u);
}

TEST(SampleCountTest, NonPositiveStepIsInvalid) {
    EXPECT_THROW(sampleCount(100.0, 0.0), InvalidSamplingWindow);
    EXPECT_THROW(sampleCount(100.0, -4.0), InvalidSamplingWindow);
}

TEST(SampleCountTest, NegativeHorizonIsInvalid) {
    EXPECT_THROW(sampleCount(-1.0, 4.0), InvalidSamplingWindow);
}

TEST(SampleCountTest, NonFiniteWindowIsInvalid) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(sampleCount(nan, 4.0), InvalidSamplingWindow);
    EXPECT_THROW(sampleCount(100.0, nan), InvalidSamplingWindow);
    EXPECT_THROW(sampleCount(inf, 4.0), InvalidSamplingWindow);
}

TEST(SampleCountTest, LargeWindowsAreCounted) {
    EXPECT_EQ(sampleCount(2.0e7, 1.0), 20'000'000u);
    EXPECT_EQ(sampleCount(1.0e12, 0.5), 2'000'000'000'000u);
}

TEST(SampleCountTest, UncountableWindowIsInvalid) {
    EXPECT_THROW(sampleCount(1e300, 1e-10), InvalidSamplingWindow);
}

TEST(SampleCountTest, InvalidWindowIsAnInvalidArgument) {
    EXPECT_THROW(sampleCount(1.0, 0.0), std::invalid_argument);
}

// ============================================================================
// Ground Track Tests
// ============================================================================

TEST_F(GroundTrackTest, DefaultWindow) {
    auto track = sampleTrack(iss, start);
    EXPECT_EQ(track.size(), 25u);
    EXPECT_EQ(track.getNoradID(), 25544);
    EXPECT_DOUBLE_EQ(track.getStepMinutes(), DEFAULT_STEP_MINUTES);
    EXPECT_EQ(track.getStart(), start);
}

TEST_F(GroundTrackTest, SamplesMatchPropagation) {
    auto track = sampleTrack(iss, start, 60.0, 5.0);
    ASSERT_EQ(track.size(), 12u);
    for (std::size_t k = 0; k < track.size(); ++k) {
        auto expected = propagate(iss, start + minutes{5 * k});
        auto point = track.at(k);
        EXPECT_NEAR(point.latInDegrees, expected.latInDegrees, 1e-9) << "sample " << k;
        EXPECT_NEAR(point.lonInDegrees, expected.lonInDegrees, 1e-9) << "sample " << k;
    }
}

TEST_F(GroundTrackTest, TimeOfEachSample) {
    auto track = sampleTrack(iss, start, 20.0, 2.5);
    EXPECT_EQ(track.timeAt(0), start);
    EXPECT_EQ(track.timeAt(4), start + minutes{10});
}

TEST_F(GroundTrackTest, IteratesInOrder) {
    auto track = sampleTrack(iss, start, 40.0, 4.0);
    std::vector<TrackPoint> points;
    for (auto point : track) {
        points.push_back(point);
    }
    ASSERT_EQ(points.size(), 10u);
    for (std::size_t k = 0; k < points.size(); ++k) {
        EXPECT_EQ(points[k], track.at(k));
    }
}

TEST_F(GroundTrackTest, CanBeIteratedAgain) {
    auto track = sampleTrack(iss, start);
    EXPECT_EQ(track.collect(), track.collect());
}

TEST_F(GroundTrackTest, PointsStayInRange) {
    auto track = sampleTrack(iss, start, 1440.0, 3.0);
    for (const auto& point : track.collect()) {
        EXPECT_LE(std::fabs(point.latInDegrees), 52.0);
        EXPECT_GE(point.lonInDegrees, -180.0);
        EXPECT_LE(point.lonInDegrees, 180.0);
    }
}

TEST_F(GroundTrackTest, EmptyWindow) {
    auto track = sampleTrack(iss, start, 0.0, 4.0);
    EXPECT_TRUE(track.empty());
    EXPECT_EQ(track.begin(), track.end());
    EXPECT_TRUE(track.collect().empty());
}

TEST_F(GroundTrackTest, PastTheEndThrows) {
    auto track = sampleTrack(iss, start, 8.0, 4.0);
    EXPECT_THROW(track.at(2), std::out_of_range);
}

TEST_F(GroundTrackTest, StopBeforeStartYieldsNothing) {
    auto track = sampleTrack(iss, start);
    std::stop_source source;
    source.request_stop();
    EXPECT_TRUE(track.collect(source.get_token()).empty());
}

TEST_F(GroundTrackTest, UnrequestedStopCollectsEverything) {
    auto track = sampleTrack(iss, start);
    std::stop_source source;
    EXPECT_EQ(track.collect(source.get_token()).size(), track.size());
}

TEST_F(GroundTrackTest, LargeWindowIsLazy) {
    auto track = sampleTrack(iss, start, 2.0e7, 1.0);
    EXPECT_EQ(track.size(), 20'000'000u);
    auto expected = propagate(iss, start);
    EXPECT_NEAR(track.at(0).latInDegrees, expected.latInDegrees, 1e-9);
}

TEST_F(GroundTrackTest, BreakingOutOfIterationStopsEarly) {
    auto track = sampleTrack(iss, start);
    std::vector<TrackPoint> points;
    for (auto point : track) {
        if (points.size() == 7) {
            break;
        }
        points.push_back(point);
    }
    ASSERT_EQ(points.size(), 7u);
    for (std::size_t k = 0; k < points.size(); ++k) {
        EXPECT_EQ(points[k], track.at(k));
    }
    EXPECT_EQ(track.collect().size(), track.size());
}

TEST(SampleTrackTest, StopRequestedWhileCollecting) {
    MeanElements elements;
    elements.inclination = 51.6;
    elements.eccentricity = 0.001;
    elements.meanMotion = 14.5;
    ElementSet dragFree(11, "DRAG FREE", sys_days{year{2025}/January/1}, elements);

    // Far more samples than can be computed before the stop arrives
    auto track = sampleTrack(dragFree, dragFree.getEpoch(), 2.0e7, 1.0);
    std::vector<TrackPoint> points;
    std::jthread worker([&](std::stop_token stop) {
        points = track.collect(stop);
    });
    std::this_thread::sleep_for(milliseconds{20});
    worker.request_stop();
    worker.join();

    EXPECT_LT(points.size(), track.size());
    for (std::size_t k = 0; k < std::min<std::size_t>(points.size(), 10); ++k) {
        EXPECT_EQ(points[k], track.at(k)) << "sample " << k;
    }
}

TEST(SampleTrackTest, ReentryEndsTheTrackEarly) {
    ElementSet set = reentering();
    auto track = sampleTrack(set, set.getEpoch(), 100.0, 4.0);
    ASSERT_EQ(track.size(), 25u);
    EXPECT_THROW(track.at(track.size() - 1), PropagationError);

    auto points = track.collect();
    EXPECT_FALSE(points.empty());
    EXPECT_LT(points.size(), track.size());
    for (std::size_t k = 0; k < points.size(); ++k) {
        EXPECT_EQ(points[k], track.at(k)) << "sample " << k;
    }
}

TEST_F(GroundTrackTest, WindowPastTheEndOfTheClockThrows) {
    double left = minutesOfClockLeft(start);
    EXPECT_THROW(sampleTrack(iss, start, 3.0 * left, 1.5 * left), InvalidSamplingWindow);
}

TEST_F(GroundTrackTest, WindowInsideTheClockIsAccepted) {
    double left = minutesOfClockLeft(start);
    auto track = sampleTrack(iss, start, 0.5 * left, 0.25 * left);
    ASSERT_EQ(track.size(), 2u);
    EXPECT_GT(track.timeAt(1), start);
}

TEST_F(GroundTrackTest, TimePastTheEndOfTheClockThrows) {
    auto track = sampleTrack(iss, start, 8.0, 4.0);
    double left = minutesOfClockLeft(start);
    EXPECT_THROW(track.timeAt(static_cast<std::size_t>(left / 4.0) + 1), std::out_of_range);
}

TEST_F(GroundTrackTest, InvalidWindowThrows) {
    EXPECT_THROW(sampleTrack(iss, start, 100.0, 0.0), InvalidSamplingWindow);
}

TEST(SampleTrackTest, WindowIsCheckedBeforeElementSet) {
    EXPECT_THROW(sampleTrack(degenerate(), time_point{}, 100.0, -1.0), InvalidSamplingWindow);
}

TEST(SampleTrackTest, DegenerateElementSetThrows) {
    EXPECT_THROW(sampleTrack(degenerate(), time_point{}), DegenerateElementSet);
}

} // namespace
} // namespace skywatch
