// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file route_loader.h
 * @brief Reading route records from JSON documents
 *
 * Document format:
 * @code
 * {"routes": [{"id": "r1",
 *              "timestamp": "2024-05-01T07:30:00Z",
 *              "category": "running",
 *              "duration_seconds": 1800,
 *              "coordinates": [[52.52, 13.405], [52.521, 13.406]]}]}
 * @endcode
 * "timestamp" is ISO-8601 (UTC "Z" or a +hh:mm offset) or epoch seconds.
 * Only "id" and "coordinates" are required. Malformed records are skipped
 * and counted, a malformed document fails the whole load.
 */

#include "route.h"

#include <route_atlas/constants.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace route_atlas {

/// Loader settings
struct RouteLoaderConfig {
    /// Split every loaded trace at GPS gaps
    bool segment_routes = true;

    /// Gap threshold of the split (meters)
    double max_gap_meters = constants::routes::DEFAULT_MAX_GAP_METERS;
};

/// Result of a route load
struct RouteLoadResult {
    bool success = false;              ///< True if the document was readable
    std::vector<Route> routes;         ///< Loaded (and possibly segmented) routes
    std::size_t record_count = 0;      ///< Records in the document
    std::size_t skipped_records = 0;   ///< Malformed records
    std::size_t dropped_routes = 0;    ///< Routes left without a usable segment
    std::string error_message;         ///< Error description if failed
};

/// Record filter applied after loading
struct RouteFilter {
    /// Accepted categories; empty accepts all
    std::vector<RouteCategory> categories;

    /// Keep routes of the last N days; 0 keeps everything
    int max_age_days = 0;
};

/// JSON route file reader
class RouteLoader {
public:
    explicit RouteLoader(RouteLoaderConfig config = RouteLoaderConfig());

    /// Load routes from a file
    [[nodiscard]] RouteLoadResult LoadFile(const std::string& path) const;

    /// Load routes from an in-memory document
    [[nodiscard]] RouteLoadResult LoadString(const std::string& document) const;

    [[nodiscard]] const RouteLoaderConfig& GetConfig() const noexcept {
        return config_;
    }

private:
    RouteLoaderConfig config_;
};

/// Parse an ISO-8601 date-time, "YYYY-MM-DDTHH:MM:SS[.fff](Z|+hh:mm|-hh:mm)"
/// @return Time point, or nullopt if text is not in that form
[[nodiscard]] std::optional<Route::Clock::time_point> ParseTimestamp(const std::string& text);

/// Routes passing filter, input order kept
[[nodiscard]] std::vector<Route> FilterRoutes(const std::vector<Route>& routes,
                                              const RouteFilter& filter,
                                              Route::Clock::time_point now = Route::Clock::now());

} // namespace route_atlas
