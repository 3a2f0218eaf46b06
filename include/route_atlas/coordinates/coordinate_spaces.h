// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

/**
 * @file coordinate_spaces.h
 * @brief Geographic coordinate types used throughout route_atlas
 *
 * Route traces, city markers and country bounding boxes are all expressed
 * in WGS84 degrees. Keeping them in one strong type prevents lat/lon from
 * being passed around as loose doubles.
 */

#pragma once

#include <route_atlas/constants.h>

#include <cmath>
#include <limits>
#include <vector>

namespace route_atlas {
namespace coordinates {

// ============================================================================
// GEOGRAPHIC SPACE (WGS84 - Degrees)
// ============================================================================

/**
 * @brief Geographic coordinates in WGS84 degrees (latitude, longitude)
 *
 * Constraints:
 * - Latitude: [-90°, +90°] (South to North)
 * - Longitude: [-180°, +180°] (West to East)
 * - Both components finite
 */
struct Geographic {
    double latitude;   ///< Latitude in degrees [-90, 90]
    double longitude;  ///< Longitude in degrees [-180, 180]

    /**
     * @brief Default constructor - creates invalid coordinates
     */
    constexpr Geographic()
        : latitude(std::numeric_limits<double>::quiet_NaN())
        , longitude(std::numeric_limits<double>::quiet_NaN()) {}

    /**
     * @brief Construct from lat/lon
     * @param lat Latitude in degrees
     * @param lon Longitude in degrees
     */
    constexpr Geographic(double lat, double lon)
        : latitude(lat), longitude(lon) {}

    /**
     * @brief Check if coordinates are finite and within WGS84 bounds
     * @return true if valid, false otherwise
     */
    [[nodiscard]] bool IsValid() const noexcept {
        return std::isfinite(latitude) && std::isfinite(longitude) &&
               latitude >= constants::geodetic::MIN_LATITUDE &&
               latitude <= constants::geodetic::MAX_LATITUDE &&
               longitude >= constants::geodetic::MIN_LONGITUDE &&
               longitude <= constants::geodetic::MAX_LONGITUDE;
    }

    /**
     * @brief Check if both axes differ by at most epsilon degrees
     */
    [[nodiscard]] bool IsApproximatelyEqual(const Geographic& other,
                                            double epsilon = 1e-9) const noexcept {
        return std::abs(latitude - other.latitude) <= epsilon &&
               std::abs(longitude - other.longitude) <= epsilon;
    }

    constexpr bool operator==(const Geographic& other) const noexcept {
        return latitude == other.latitude && longitude == other.longitude;
    }

    constexpr bool operator!=(const Geographic& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Axis-aligned bounding box in geographic space
 * @note min = southwest corner, max = northeast corner; bounds are inclusive
 */
struct GeographicBounds {
    Geographic min;  ///< Southwest corner (min lat, min lon)
    Geographic max;  ///< Northeast corner (max lat, max lon)

    /**
     * @brief Default constructor - creates inverted (empty) bounds
     */
    constexpr GeographicBounds()
        : min(90.0, 180.0)
        , max(-90.0, -180.0) {}

    constexpr GeographicBounds(const Geographic& min_corner, const Geographic& max_corner)
        : min(min_corner), max(max_corner) {}

    /**
     * @brief Construct from the four edges
     */
    constexpr GeographicBounds(double min_lat, double max_lat,
                               double min_lon, double max_lon)
        : min(min_lat, min_lon), max(max_lat, max_lon) {}

    [[nodiscard]] bool IsValid() const noexcept {
        return min.latitude <= max.latitude &&
               min.longitude <= max.longitude &&
               min.IsValid() && max.IsValid();
    }

    /**
     * @brief Inclusive containment test
     */
    [[nodiscard]] constexpr bool Contains(double latitude, double longitude) const noexcept {
        return latitude >= min.latitude && latitude <= max.latitude &&
               longitude >= min.longitude && longitude <= max.longitude;
    }

    [[nodiscard]] constexpr bool Contains(const Geographic& point) const noexcept {
        return Contains(point.latitude, point.longitude);
    }

    /**
     * @brief Box extent in square degrees
     *
     * Only used to rank overlapping boxes against each other, so the
     * latitude-dependent shrinking of longitude degrees is ignored.
     */
    [[nodiscard]] constexpr double AreaDegrees() const noexcept {
        return (max.latitude - min.latitude) * (max.longitude - min.longitude);
    }
};

/// True if every point of the trace is a valid coordinate
[[nodiscard]] inline bool AllValid(const std::vector<Geographic>& points) noexcept {
    for (const auto& point : points) {
        if (!point.IsValid()) {
            return false;
        }
    }
    return true;
}

} // namespace coordinates
} // namespace route_atlas
