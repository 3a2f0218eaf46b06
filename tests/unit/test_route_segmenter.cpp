// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

/**
 * @file test_route_segmenter.cpp
 * @brief Unit tests for splitting GPS traces at gaps
 */

#include <gtest/gtest.h>
#include <route_atlas/routes/route_segmenter.h>

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace route_atlas;
using route_atlas::coordinates::Geographic;

namespace {

const double kMetersPerDegree = 6371000.0 * std::acos(-1.0) / 180.0;

/// Point `meters` north of the origin
Geographic North(double meters) {
    return Geographic(52.5200 + meters / kMetersPerDegree, 13.4050);
}

} // anonymous namespace

class RouteSegmenterTest : public ::testing::Test {
protected:
    RouteSegmenter segmenter_;
};

TEST_F(RouteSegmenterTest, DefaultGap) {
    EXPECT_DOUBLE_EQ(20.0, segmenter_.GetMaxGapMeters());
}

TEST_F(RouteSegmenterTest, RejectsNonPositiveGap) {
    EXPECT_THROW(RouteSegmenter(0.0), std::invalid_argument);
    EXPECT_THROW(RouteSegmenter(-5.0), std::invalid_argument);
}

TEST_F(RouteSegmenterTest, ContinuousTraceIsOneSegment) {
    const RouteSegmenter::Trace trace = {North(0), North(10), North(20), North(30), North(40)};
    const auto segments = segmenter_.Segment(trace);
    ASSERT_EQ(1u, segments.size());
    EXPECT_EQ(trace, segments.front());
}

TEST_F(RouteSegmenterTest, IsolatedPointsAreDiscarded) {
    // Middle point 500 m away from both neighbours
    const RouteSegmenter::Trace trace = {North(0), North(500), North(0)};
    EXPECT_TRUE(segmenter_.Segment(trace).empty());

    const Route route("spike", trace);
    EXPECT_TRUE(segmenter_.SplitRoute(route).empty());
}

TEST_F(RouteSegmenterTest, SplitsAtGap) {
    const RouteSegmenter::Trace trace = {North(0), North(10), North(19),
                                         North(1000), North(1015)};
    const auto segments = segmenter_.Segment(trace);
    ASSERT_EQ(2u, segments.size());
    EXPECT_EQ(3u, segments[0].size());
    EXPECT_EQ(2u, segments[1].size());
    EXPECT_EQ(North(1000), segments[1].front());
}

TEST_F(RouteSegmenterTest, GapJustAboveThresholdSplits) {
    const RouteSegmenter::Trace trace = {North(0), North(5), North(26), North(31)};
    EXPECT_EQ(2u, segmenter_.Segment(trace).size());
}

TEST_F(RouteSegmenterTest, EmptyAndSinglePointTraces) {
    EXPECT_TRUE(segmenter_.Segment({}).empty());
    EXPECT_TRUE(segmenter_.Segment({North(0)}).empty());
}

TEST_F(RouteSegmenterTest, UnsplitRouteIsReturnedUnchanged) {
    const Route route("r1", {North(0), North(10), North(20)});
    const auto result = segmenter_.SplitRoute(route);
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ("r1", result.front().GetId());
    EXPECT_DOUBLE_EQ(route.DistanceKm(), result.front().DistanceKm());
}

TEST_F(RouteSegmenterTest, SegmentRoutesKeepMetadata) {
    const auto timestamp = Route::Clock::time_point(std::chrono::seconds(1700000000));
    const Route route("r2",
                      {North(0), North(10), North(19), North(1000), North(1015)},
                      timestamp, RouteCategory::RUNNING, 500.0);

    const auto result = segmenter_.SplitRoute(route);
    ASSERT_EQ(2u, result.size());

    EXPECT_EQ("r2#1", result[0].GetId());
    EXPECT_EQ("r2#2", result[1].GetId());
    for (const auto& segment : result) {
        EXPECT_EQ(timestamp, segment.GetTimestamp());
        EXPECT_EQ(RouteCategory::RUNNING, segment.GetCategory());
    }
    EXPECT_DOUBLE_EQ(300.0, result[0].GetDurationSeconds());
    EXPECT_DOUBLE_EQ(200.0, result[1].GetDurationSeconds());

    // The gap itself is not counted
    EXPECT_NEAR(0.019, result[0].DistanceKm(), 1e-6);
    EXPECT_NEAR(0.015, result[1].DistanceKm(), 1e-6);
}

TEST_F(RouteSegmenterTest, SplitRoutesKeepsInputOrder) {
    const std::vector<Route> routes = {
        Route("a", {North(0), North(10)}),
        Route("b", {North(0), North(500)}),
        Route("c", {North(0), North(10), North(100), North(110)}),
    };

    const auto result = segmenter_.SplitRoutes(routes);
    ASSERT_EQ(3u, result.size());
    EXPECT_EQ("a", result[0].GetId());
    EXPECT_EQ("c#1", result[1].GetId());
    EXPECT_EQ("c#2", result[2].GetId());
}

TEST_F(RouteSegmenterTest, CustomGap) {
    const RouteSegmenter wide(600.0);
    const RouteSegmenter::Trace trace = {North(0), North(500), North(0)};
    EXPECT_EQ(1u, wide.Segment(trace).size());
}
