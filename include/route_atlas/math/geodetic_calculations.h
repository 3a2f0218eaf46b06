// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file geodetic_calculations.h
 * @brief Great-circle distance calculations
 *
 * Haversine distances on a spherical Earth (radius 6371 km) between
 * coordinate pairs and along GPS traces.
 */

#include <route_atlas/coordinates/coordinate_spaces.h>

#include <vector>

namespace route_atlas {

/**
 * @brief Geodetic calculation utilities
 */
class GeodeticCalculator {
public:
    /**
     * @brief Calculate great-circle distance using Haversine formula
     *
     * Symmetric, zero for identical points and monotonic in the angular
     * separation of the two points.
     *
     * @param point1 First geographic point
     * @param point2 Second geographic point
     * @return double Distance in kilometers
     */
    static double HaversineDistanceKm(const coordinates::Geographic& point1,
                                      const coordinates::Geographic& point2);

    /**
     * @brief Same as HaversineDistanceKm, expressed in meters
     */
    static double HaversineDistanceMeters(const coordinates::Geographic& point1,
                                          const coordinates::Geographic& point2);

    /**
     * @brief Calculate total length of a trace
     *
     * @param points Trace points in order
     * @return double Sum of consecutive distances in kilometers, 0 for fewer
     *         than two points
     */
    static double RouteDistanceKm(const std::vector<coordinates::Geographic>& points);

    /**
     * @brief Cumulative distance along a trace
     *
     * @param points Trace points in order
     * @return std::vector<double> Element i is the distance in kilometers from
     *         points[0] to points[i] along the trace
     */
    static std::vector<double> CumulativeDistanceKm(
        const std::vector<coordinates::Geographic>& points);

    /**
     * @brief Check that a computed distance is usable (finite, non-negative)
     */
    static bool IsValidDistance(double distance_km) noexcept;
};

} // namespace route_atlas
