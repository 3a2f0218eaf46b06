// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

/**
 * @file test_coordinate_spaces.cpp
 * @brief Unit tests for geographic coordinates and bounding boxes
 */

#include <gtest/gtest.h>
#include <route_atlas/coordinates/coordinate_spaces.h>
#include <cmath>
#include <limits>

using namespace route_atlas::coordinates;

// ============================================================================
// Geographic Tests
// ============================================================================

class GeographicTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(GeographicTest, DefaultConstructor_CreatesInvalidCoordinates) {
    Geographic geo;
    EXPECT_FALSE(geo.IsValid());
    EXPECT_TRUE(std::isnan(geo.latitude));
    EXPECT_TRUE(std::isnan(geo.longitude));
}

TEST_F(GeographicTest, ValidCoordinates_PassValidation) {
    Geographic berlin(52.52, 13.405);
    EXPECT_TRUE(berlin.IsValid());
    EXPECT_DOUBLE_EQ(52.52, berlin.latitude);
    EXPECT_DOUBLE_EQ(13.405, berlin.longitude);
}

TEST_F(GeographicTest, OutOfRange_FailsValidation) {
    EXPECT_FALSE(Geographic(91.0, 0.0).IsValid());
    EXPECT_FALSE(Geographic(-91.0, 0.0).IsValid());
    EXPECT_FALSE(Geographic(0.0, 181.0).IsValid());
    EXPECT_FALSE(Geographic(0.0, -181.0).IsValid());
}

TEST_F(GeographicTest, NonFinite_FailsValidation) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(Geographic(inf, 0.0).IsValid());
    EXPECT_FALSE(Geographic(0.0, -inf).IsValid());
    EXPECT_FALSE(Geographic(std::nan(""), 0.0).IsValid());
}

TEST_F(GeographicTest, BoundaryCoordinates_AreValid) {
    EXPECT_TRUE(Geographic(90.0, 0.0).IsValid());
    EXPECT_TRUE(Geographic(-90.0, 0.0).IsValid());
    EXPECT_TRUE(Geographic(0.0, -180.0).IsValid());
    EXPECT_TRUE(Geographic(0.0, 180.0).IsValid());
}

TEST_F(GeographicTest, ApproximateEquality_UsesEpsilonPerAxis) {
    Geographic a(10.0, 20.0);
    Geographic b(10.00005, 20.00005);
    EXPECT_TRUE(a.IsApproximatelyEqual(b, 0.0001));
    EXPECT_FALSE(a.IsApproximatelyEqual(b, 0.00001));
    EXPECT_NE(a, b);
    EXPECT_EQ(a, Geographic(10.0, 20.0));
}

// ============================================================================
// GeographicBounds Tests
// ============================================================================

TEST(GeographicBoundsTest, DefaultBounds_AreEmpty) {
    GeographicBounds bounds;
    EXPECT_FALSE(bounds.IsValid());
    EXPECT_FALSE(bounds.Contains(0.0, 0.0));
}

TEST(GeographicBoundsTest, Contains_IsInclusive) {
    GeographicBounds bounds(47.3, 55.1, 5.9, 15.0);
    EXPECT_TRUE(bounds.IsValid());
    EXPECT_TRUE(bounds.Contains(52.52, 13.405));
    EXPECT_TRUE(bounds.Contains(47.3, 5.9));
    EXPECT_TRUE(bounds.Contains(55.1, 15.0));
    EXPECT_FALSE(bounds.Contains(55.1001, 10.0));
    EXPECT_FALSE(bounds.Contains(50.0, 15.0001));
}

TEST(GeographicBoundsTest, AreaDegrees_IsProductOfExtents) {
    GeographicBounds bounds(Geographic(10.0, 20.0), Geographic(12.0, 25.0));
    EXPECT_DOUBLE_EQ(10.0, bounds.AreaDegrees());
}

TEST(GeographicBoundsTest, AllValid_RejectsAnyBadPoint) {
    EXPECT_TRUE(AllValid({}));
    EXPECT_TRUE(AllValid({Geographic(1.0, 2.0), Geographic(3.0, 4.0)}));
    EXPECT_FALSE(AllValid({Geographic(1.0, 2.0), Geographic(95.0, 4.0)}));
}
