// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file snapshot.h
 * @brief Immutable aggregation results handed to consumers
 */

#include "tally.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace route_atlas {

/// Data-quality problems recovered during a run. None of them is fatal.
enum class DataIssue {
    INVALID_COORDINATE,       ///< Route skipped: coordinate non-finite or out of range
    INVALID_DISTANCE,         ///< Route excluded: distance non-finite or negative
    CORRUPTED_CACHE,          ///< Persisted cache map discarded
    GEOCODE_MISS,             ///< Point outside every country box
    NETWORK_GEOCODE_FAILURE   ///< Provider lookup failed; point left ungeocoded
};

[[nodiscard]] const char* DataIssueName(DataIssue issue) noexcept;

/// Counters describing data quality and cache maintenance of a run
struct AggregationDiagnostics {
    std::size_t too_short_routes;           ///< Routes with fewer than 2 points
    std::size_t invalid_distance_routes;
    std::size_t invalid_coordinate_routes;
    std::size_t corrupted_cache_maps;
    std::size_t geocode_misses;
    std::size_t network_failures;
    std::size_t cache_hits;
    std::size_t renamed_cache_countries;    ///< Rewritten by the load cleanup
    std::size_t removed_cache_orphans;      ///< Dropped by the load cleanup

    AggregationDiagnostics()
        : too_short_routes(0), invalid_distance_routes(0), invalid_coordinate_routes(0),
          corrupted_cache_maps(0), geocode_misses(0), network_failures(0),
          cache_hits(0), renamed_cache_countries(0), removed_cache_orphans(0) {}

    /// Count an occurrence of issue
    void Record(DataIssue issue, std::size_t count = 1);

    /// Occurrences of issue
    [[nodiscard]] std::size_t Count(DataIssue issue) const;

    /// Routes excluded during validation
    [[nodiscard]] std::size_t DiscardedRoutes() const {
        return too_short_routes + invalid_distance_routes;
    }
};

/// Point-in-time view of an aggregation run
struct Snapshot {
    std::uint64_t generation;           ///< Run that produced the snapshot
    double total_km;                    ///< Distance of all accepted routes
    std::vector<TallyEntry> countries;  ///< Sorted by km descending
    std::vector<TallyEntry> cities;     ///< Sorted by km descending
    std::size_t processed;              ///< Accepted routes handled so far
    std::size_t total;                  ///< Accepted routes
    std::size_t unique_coords;          ///< Distinct quantized keys seen this run
    std::size_t geocoded_count;         ///< Keys resolved by the provider this run
    bool done;                          ///< Final snapshot of the run
    AggregationDiagnostics diagnostics;

    Snapshot()
        : generation(0), total_km(0.0), processed(0), total(0),
          unique_coords(0), geocoded_count(0), done(false) {}

    /// km of a country label, 0 if absent
    [[nodiscard]] double CountryKm(const std::string& label) const;

    /// km of a city label, 0 if absent
    [[nodiscard]] double CityKm(const std::string& label) const;

    /// Sum over the country list
    [[nodiscard]] double CountrySum() const;
};

/// Receives every snapshot a run publishes, on the aggregating thread
using SnapshotCallback = std::function<void(const Snapshot&)>;

} // namespace route_atlas
