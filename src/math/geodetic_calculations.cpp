// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

/**
 * @file geodetic_calculations.cpp
 * @brief Geodetic calculations implementation
 */

#include <route_atlas/math/geodetic_calculations.h>
#include <route_atlas/constants.h>

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>

namespace route_atlas {

namespace {
    inline double DegreesToRadians(double degrees) {
        return glm::radians(degrees);
    }
}

double GeodeticCalculator::HaversineDistanceKm(const coordinates::Geographic& point1,
                                               const coordinates::Geographic& point2) {
    const double lat1_rad = DegreesToRadians(point1.latitude);
    const double lat2_rad = DegreesToRadians(point2.latitude);
    const double delta_lat = lat2_rad - lat1_rad;
    const double delta_lon = DegreesToRadians(point2.longitude - point1.longitude);

    const double sin_delta_lat_2 = std::sin(delta_lat / 2.0);
    const double sin_delta_lon_2 = std::sin(delta_lon / 2.0);

    double a = sin_delta_lat_2 * sin_delta_lat_2 +
               std::cos(lat1_rad) * std::cos(lat2_rad) *
               sin_delta_lon_2 * sin_delta_lon_2;

    // Rounding can push a slightly above 1 for antipodal points
    a = std::clamp(a, 0.0, 1.0);

    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return constants::geodetic::EARTH_MEAN_RADIUS_KM * c;
}

double GeodeticCalculator::HaversineDistanceMeters(const coordinates::Geographic& point1,
                                                   const coordinates::Geographic& point2) {
    return HaversineDistanceKm(point1, point2) * constants::geodetic::METERS_PER_KM;
}

double GeodeticCalculator::RouteDistanceKm(const std::vector<coordinates::Geographic>& points) {
    if (points.size() < 2) {
        return 0.0;
    }

    double total = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        total += HaversineDistanceKm(points[i - 1], points[i]);
    }
    return total;
}

std::vector<double> GeodeticCalculator::CumulativeDistanceKm(
    const std::vector<coordinates::Geographic>& points) {

    std::vector<double> cumulative;
    cumulative.reserve(points.size());

    double running = 0.0;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (i > 0) {
            running += HaversineDistanceKm(points[i - 1], points[i]);
        }
        cumulative.push_back(running);
    }
    return cumulative;
}

bool GeodeticCalculator::IsValidDistance(double distance_km) noexcept {
    return std::isfinite(distance_km) && distance_km >= 0.0;
}

} // namespace route_atlas
