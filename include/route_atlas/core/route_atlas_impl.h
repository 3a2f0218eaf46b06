// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file route_atlas_impl.h
 * @brief Implementation of the main Route Atlas interface
 *
 * Internal implementation class for the Route Atlas library.
 * This header is not part of the public API.
 */

#include <route_atlas/route_atlas.h>
#include <route_atlas/data/cache_storage.h>

#include <memory>

namespace route_atlas {

/**
 * @brief Internal implementation of RouteAtlas interface
 */
class RouteAtlasImpl : public RouteAtlas {
public:
    /**
     * @brief Constructor
     *
     * @param config Validated configuration
     * @param provider Geocoder for cache misses
     * @param storage Geocode cache storage
     */
    RouteAtlasImpl(const Configuration& config,
                   std::shared_ptr<GeocodeProvider> provider,
                   std::shared_ptr<CacheStorage> storage);

    ~RouteAtlasImpl() override;

    // RouteAtlas interface implementation
    RouteLoadResult LoadRoutes(const std::string& file_path) override;
    StatsAggregator::Generation StartAggregation(std::vector<Route> routes,
                                                 SnapshotCallback callback) override;
    Snapshot Aggregate(const std::vector<Route>& routes,
                       const SnapshotCallback& callback) override;
    void Wait() override;
    StatsAggregator& GetAggregator() override;
    GeocodeProvider& GetGeocoder() override;
    const Configuration& GetConfiguration() const override;

private:
    Configuration config_;                         ///< Configuration parameters
    std::shared_ptr<GeocodeProvider> provider_;    ///< Geocoder backend
    std::shared_ptr<CacheStorage> storage_;        ///< Geocode cache storage
    RouteLoader loader_;                           ///< Route file reader
    std::unique_ptr<StatsAggregator> aggregator_;  ///< Aggregation worker
};

} // namespace route_atlas
