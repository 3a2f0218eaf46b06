// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file route_atlas.h
 * @brief Main public interface for the Route Atlas library
 *
 * This header provides the primary interface for aggregating GPS route
 * distances per country and per city. It includes the library-wide
 * configuration, its JSON loader and the factory for atlas instances.
 *
 * @version 0.1.0
 */

#include <route_atlas/constants.h>
#include <route_atlas/geocoding/local_geocoder.h>
#include <route_atlas/geocoding/network_geocoder.h>
#include <route_atlas/routes/route_loader.h>
#include <route_atlas/routes/route_sampler.h>
#include <route_atlas/stats/snapshot.h>
#include <route_atlas/stats/stats_aggregator.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace route_atlas {

/// Geocoder backend used on cache misses
enum class GeocoderKind {
    LOCAL,   ///< Compiled-in bounding-box database (default)
    NETWORK  ///< HTTP reverse geocoding
};

/**
 * @brief Configuration structure for Route Atlas initialization
 */
struct Configuration {
    /** Directory of the persistent geocode cache */
    std::string cache_directory = constants::cache::DEFAULT_DIRECTORY;

    /** Sample budget per route */
    std::size_t max_samples_per_route = constants::routes::DEFAULT_MAX_SAMPLES;

    /** Routes between two progress snapshots */
    std::size_t publish_interval_routes = constants::aggregator::DEFAULT_PUBLISH_INTERVAL;

    /** GPS gap that splits a trace into segments (meters) */
    double max_gap_meters = constants::routes::DEFAULT_MAX_GAP_METERS;

    /** Split loaded traces at GPS gaps */
    bool segment_routes = true;

    /** Distance attribution over a route's samples */
    DistanceAttribution attribution = DistanceAttribution::EQUAL_SHARE;

    /** Resolution of overlapping country boxes */
    CountryMatchPolicy country_match = CountryMatchPolicy::FIRST_MATCH;

    /** Geocoder backend */
    GeocoderKind geocoder = GeocoderKind::LOCAL;

    /** Network geocoder settings */
    NetworkGeocoderConfig network;

    /** Concurrent lookups of the network backend */
    std::size_t network_max_concurrent_lookups = constants::aggregator::NETWORK_MAX_CONCURRENT_LOOKUPS;

    /** spdlog level name: trace, debug, info, warn, error, critical, off */
    std::string log_level = "info";
};

/**
 * @brief Overlay the keys present in a JSON file onto config
 *
 * Keys that are absent keep their current value. On failure config is left
 * unchanged.
 *
 * @param path JSON configuration file
 * @param config Configuration to update
 * @param error_message Set on failure
 * @return true on success
 */
bool LoadConfiguration(const std::string& path, Configuration& config, std::string& error_message);

/**
 * @brief Same as LoadConfiguration for an in-memory JSON document
 */
bool ParseConfiguration(const std::string& document, Configuration& config, std::string& error_message);

/**
 * @brief Check value ranges
 *
 * Rejects zero sample budgets, zero publish intervals, non-positive gaps,
 * zero network concurrency or timeout, and unknown log levels.
 *
 * @return true if config is usable
 */
bool ValidateConfiguration(const Configuration& config, std::string& error_message);

/// Aggregator parameters derived from config
[[nodiscard]] StatsAggregatorConfig MakeAggregatorConfig(const Configuration& config);

/// Loader parameters derived from config
[[nodiscard]] RouteLoaderConfig MakeLoaderConfig(const Configuration& config);

/// Apply config.log_level to the default spdlog logger
/// @return false if the level name is unknown
bool ApplyLogLevel(const Configuration& config);

/**
 * @brief Main Route Atlas interface class
 *
 * Owns the geocoder, the cache storage and the aggregator built from a
 * Configuration. Aggregations started through this interface run on the
 * aggregator's worker thread; results arrive through the snapshot callback.
 */
class RouteAtlas {
public:
    /**
     * @brief Factory method to create a new Route Atlas instance
     *
     * @param config Configuration parameters
     * @return New instance, or nullptr if the configuration is invalid or the
     *         cache directory cannot be created
     */
    static std::unique_ptr<RouteAtlas> Create(const Configuration& config = Configuration{});

    virtual ~RouteAtlas() = default;

    /**
     * @brief Load a route file with the configured segmentation
     */
    virtual RouteLoadResult LoadRoutes(const std::string& file_path) = 0;

    /**
     * @brief Start an aggregation on the worker thread
     *
     * Supersedes every aggregation started before.
     *
     * @return Generation of the new aggregation
     */
    virtual StatsAggregator::Generation StartAggregation(std::vector<Route> routes,
                                                         SnapshotCallback callback) = 0;

    /**
     * @brief Aggregate on the calling thread
     *
     * @return Final snapshot
     */
    virtual Snapshot Aggregate(const std::vector<Route>& routes,
                               const SnapshotCallback& callback = nullptr) = 0;

    /**
     * @brief Block until the worker has no aggregation left
     */
    virtual void Wait() = 0;

    virtual StatsAggregator& GetAggregator() = 0;

    virtual GeocodeProvider& GetGeocoder() = 0;

    virtual const Configuration& GetConfiguration() const = 0;

protected:
    /**
     * @brief Protected constructor to enforce factory pattern
     */
    RouteAtlas() = default;
};

} // namespace route_atlas
