// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file constants.h
 * @brief Central repository for all route_atlas constants
 *
 * Single source of truth for the numeric thresholds used by the geocoder,
 * the route-cleaning pipeline, the geocode cache and the aggregator.
 * Constants are grouped into namespaces by the component that owns them.
 *
 * Units: kilometers for route and city distances, meters for GPS gaps,
 * degrees for coordinates.
 */

#include <cstddef>

namespace route_atlas {
namespace constants {

//==============================================================================
// Earth Geodetic Constants
//==============================================================================

namespace geodetic {
    /// Mean radius of Earth in kilometers (haversine sphere)
    constexpr double EARTH_MEAN_RADIUS_KM = 6371.0;

    /// Meters per kilometer
    constexpr double METERS_PER_KM = 1000.0;

    /// Latitude range in degrees
    constexpr double MIN_LATITUDE = -90.0;
    constexpr double MAX_LATITUDE = 90.0;

    /// Longitude range in degrees
    constexpr double MIN_LONGITUDE = -180.0;
    constexpr double MAX_LONGITUDE = 180.0;
} // namespace geodetic

//==============================================================================
// Local Geocoder
//==============================================================================

/**
 * @namespace geocoder
 * @brief Distance tiers that map nearest-city distance to a city label
 *
 * d <= CITY_NEAR_KM         -> city name, CONFIDENCE_NEAR
 * d <= CITY_CLOSE_KM        -> city name, CONFIDENCE_CLOSE
 * d <= CITY_REGION_KM       -> "Rural {country}", CONFIDENCE_REGION
 * otherwise                 -> "Other {country}", CONFIDENCE_COUNTRY
 */
namespace geocoder {
    constexpr double CITY_NEAR_KM = 10.0;
    constexpr double CITY_CLOSE_KM = 25.0;
    constexpr double CITY_REGION_KM = 50.0;

    constexpr double CONFIDENCE_NEAR = 0.95;
    constexpr double CONFIDENCE_CLOSE = 0.80;
    constexpr double CONFIDENCE_REGION = 0.70;
    constexpr double CONFIDENCE_COUNTRY = 0.60;
    constexpr double CONFIDENCE_NONE = 0.0;

    /// Label used for both country and city when no bounding box matches
    constexpr const char* UNKNOWN_LABEL = "Unknown";

    /// Prefix of the regional label for points 25-50 km from a city
    constexpr const char* RURAL_PREFIX = "Rural ";

    /// Prefix of the country-level label for points > 50 km from a city
    constexpr const char* OTHER_PREFIX = "Other ";
} // namespace geocoder

//==============================================================================
// Route Pipeline
//==============================================================================

namespace routes {
    /// Largest gap between consecutive GPS points inside one segment (meters)
    constexpr double DEFAULT_MAX_GAP_METERS = 20.0;

    /// Minimum number of points that carries distance information
    constexpr std::size_t MIN_SEGMENT_POINTS = 2;

    /// Sample budget per route
    constexpr std::size_t DEFAULT_MAX_SAMPLES = 10;

    /// Last point is appended when it differs from the last sample by more
    /// than this in either axis (degrees)
    constexpr double SAMPLE_DEDUP_TOLERANCE_DEG = 0.0001;
} // namespace routes

//==============================================================================
// Geocode Cache
//==============================================================================

namespace cache {
    /// Storage key of the coord -> country map
    constexpr const char* COUNTRY_MAP_KEY = "coordCountryCache";

    /// Storage key of the coord -> city map
    constexpr const char* CITY_MAP_KEY = "coordCityCache";

    /// Decimal places of a quantized key (~111 m cells)
    constexpr int KEY_DECIMALS = 3;

    /// Default directory of the file-backed storage
    constexpr const char* DEFAULT_DIRECTORY = "./route_atlas_cache";
} // namespace cache

//==============================================================================
// Aggregator
//==============================================================================

namespace aggregator {
    /// Label of the remainder bucket in the country tally
    constexpr const char* UNKNOWN_BUCKET_LABEL = "(Unknown)";

    /// Smallest remainder (km) that creates the "(Unknown)" bucket
    constexpr double UNKNOWN_BUCKET_EPSILON_KM = 1e-9;

    /// Routes processed between two progress snapshots
    constexpr std::size_t DEFAULT_PUBLISH_INTERVAL = 10;

    /// Concurrent lookups of the network path
    constexpr std::size_t NETWORK_MAX_CONCURRENT_LOOKUPS = 50;
} // namespace aggregator

//==============================================================================
// Network Geocoder
//==============================================================================

namespace network {
    /// Nominatim-compatible reverse geocoding endpoint
    /// Placeholders: {lat}, {lon}
    constexpr const char* DEFAULT_URL_TEMPLATE =
        "https://nominatim.openstreetmap.org/reverse?format=jsonv2&zoom=10&lat={lat}&lon={lon}";

    constexpr const char* DEFAULT_USER_AGENT = "RouteAtlas/0.1.0";

    constexpr long DEFAULT_TIMEOUT_SECONDS = 10;

    /// Confidence of a network result that names a locality
    constexpr double CONFIDENCE_LOCALITY = 0.90;
} // namespace network

} // namespace constants
} // namespace route_atlas
