// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file stats_aggregator.h
 * @brief Per-country and per-city distance aggregation over a route set
 *
 * A run validates the routes, samples each one, resolves the samples
 * through the geocode cache and the GeocodeProvider, attributes the route
 * distance to the resolved country and city, and publishes immutable
 * Snapshots while it progresses. The final snapshot has done = true.
 *
 * Runs started with Start() execute one at a time on the aggregator's own
 * worker thread. Every Start() supersedes the runs before it: a superseded
 * run stops at its next check, saves the cache entries it produced and
 * publishes nothing further, so consumers only ever see the latest run.
 * Runs never overlap: Run() waits for an executing worker run to stop
 * before it loads the geocode cache.
 */

#include "snapshot.h"

#include <route_atlas/constants.h>
#include <route_atlas/data/cache_storage.h>
#include <route_atlas/geocoding/geocode_provider.h>
#include <route_atlas/routes/route.h>
#include <route_atlas/routes/route_sampler.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace route_atlas {

class GeoCache;

/// Aggregation parameters
struct StatsAggregatorConfig {
    /// Sample budget per route
    std::size_t max_samples_per_route = constants::routes::DEFAULT_MAX_SAMPLES;

    /// Routes between two progress snapshots
    std::size_t publish_interval_routes = constants::aggregator::DEFAULT_PUBLISH_INTERVAL;

    /// Distance attribution over a route's samples
    DistanceAttribution attribution = DistanceAttribution::EQUAL_SHARE;

    /// Lookups in flight at once; values above 1 select the concurrent path
    /// (requires a thread-safe provider)
    std::size_t max_concurrent_lookups = 1;
};

/// Orchestrates sampling, cache lookups, geocoding and tallying
class StatsAggregator {
public:
    using Generation = std::uint64_t;

    /**
     * @brief Constructor
     *
     * @param provider Geocoder consulted on cache misses
     * @param storage Persistent storage of the geocode cache
     * @param config Aggregation parameters
     * @throws std::invalid_argument if a collaborator is null or a count is 0
     */
    StatsAggregator(std::shared_ptr<GeocodeProvider> provider,
                    std::shared_ptr<CacheStorage> storage,
                    StatsAggregatorConfig config = StatsAggregatorConfig());

    /// Invalidates every outstanding run and joins the worker
    ~StatsAggregator();

    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    /**
     * @brief Aggregate routes on the calling thread
     *
     * Takes a new generation, so it supersedes any run started before,
     * then waits until a superseded worker run has saved its cache.
     *
     * @param routes Route set; not modified
     * @param callback Receives progress snapshots and the final one (may be empty)
     * @return Last snapshot built by the run
     * @throws std::logic_error if called from a snapshot callback on the worker thread
     */
    Snapshot Run(const std::vector<Route>& routes, const SnapshotCallback& callback = nullptr);

    /**
     * @brief Queue an aggregation on the worker thread
     *
     * @param routes Route set (copied into the run)
     * @param callback Receives the snapshots, called on the worker thread
     * @return Generation of the new run
     */
    Generation Start(std::vector<Route> routes, SnapshotCallback callback);

    /// Block until no run is queued or executing
    void Wait();

    /// Wait at most timeout for the worker to become idle
    /// @return True if idle
    bool WaitFor(std::chrono::milliseconds timeout);

    /// Generation of the most recently requested run
    [[nodiscard]] Generation GetCurrentGeneration() const noexcept {
        return generation_.load();
    }

    /// True if generation is still the latest requested run
    [[nodiscard]] bool IsCurrent(Generation generation) const noexcept {
        return generation_.load() == generation;
    }

    [[nodiscard]] const StatsAggregatorConfig& GetConfig() const noexcept {
        return config_;
    }

private:
    struct Job {
        Generation generation;
        std::vector<Route> routes;
        SnapshotCallback callback;
    };

    struct RunState;

    Snapshot Execute(Generation generation,
                     const std::vector<Route>& routes,
                     const SnapshotCallback& callback);

    /// Geocode every sample on this thread, in input order
    void ProcessSequential(RunState& state, GeoCache& cache, const SnapshotCallback& callback);

    /// Fan lookups out over a bounded pool; one mutex guards the shared state
    void ProcessConcurrent(RunState& state, GeoCache& cache, const SnapshotCallback& callback);

    /// Tally one resolved sample; caller holds any needed lock
    void TallySample(RunState& state, const std::string& country, const std::string& city,
                     double share_km);

    /// Publish snapshot if generation is current
    bool Publish(const Snapshot& snapshot, const SnapshotCallback& callback) const;

    Snapshot BuildSnapshot(const RunState& state, bool done) const;

    GeocodeLookup Lookup(double latitude, double longitude);

    void WorkerThreadMain();

    std::shared_ptr<GeocodeProvider> provider_;
    std::shared_ptr<CacheStorage> storage_;
    StatsAggregatorConfig config_;
    RouteSampler sampler_;

    std::atomic<Generation> generation_{0};

    /// Held by a run from cache load to cache save
    std::mutex run_mutex_;

    /// Serializes providers that are not thread-safe
    std::mutex provider_mutex_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    bool busy_ = false;
    bool shutdown_ = false;
    std::thread worker_;
};

} // namespace route_atlas
