// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/stats/stats_aggregator.h>
#include <route_atlas/stats/tally.h>
#include <route_atlas/core/thread_pool.h>
#include <route_atlas/data/geo_cache.h>
#include <route_atlas/geocoding/country_names.h>
#include <route_atlas/math/geodetic_calculations.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace route_atlas {

/// Mutable state of one run; owned by the thread executing it
struct StatsAggregator::RunState {
    Generation generation = 0;
    std::vector<const Route*> accepted;
    double total_km = 0.0;
    Tally countries;
    Tally cities;
    std::unordered_set<std::string> seen_keys;
    std::unordered_set<std::string> geocoded_keys;
    std::size_t processed = 0;
    AggregationDiagnostics diagnostics;
    bool superseded = false;
};

StatsAggregator::StatsAggregator(std::shared_ptr<GeocodeProvider> provider,
                                 std::shared_ptr<CacheStorage> storage,
                                 StatsAggregatorConfig config)
    : provider_(std::move(provider))
    , storage_(std::move(storage))
    , config_(config)
    , sampler_(config.max_samples_per_route, config.attribution) {

    if (!provider_) {
        spdlog::error("StatsAggregator: null geocode provider");
        throw std::invalid_argument("GeocodeProvider cannot be null");
    }
    if (!storage_) {
        spdlog::error("StatsAggregator: null cache storage");
        throw std::invalid_argument("CacheStorage cannot be null");
    }
    if (config_.publish_interval_routes == 0) {
        throw std::invalid_argument("StatsAggregator: publish_interval_routes must be at least 1");
    }
    if (config_.max_concurrent_lookups == 0) {
        throw std::invalid_argument("StatsAggregator: max_concurrent_lookups must be at least 1");
    }

    worker_ = std::thread(&StatsAggregator::WorkerThreadMain, this);
}

StatsAggregator::~StatsAggregator() {
    // Invalidate queued and running jobs
    ++generation_;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

Snapshot StatsAggregator::Run(const std::vector<Route>& routes, const SnapshotCallback& callback) {
    if (std::this_thread::get_id() == worker_.get_id()) {
        throw std::logic_error("StatsAggregator: Run() called from the worker thread");
    }

    const Generation generation = ++generation_;
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    return Execute(generation, routes, callback);
}

StatsAggregator::Generation StatsAggregator::Start(std::vector<Route> routes,
                                                   SnapshotCallback callback) {
    Generation generation = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        generation = ++generation_;
        jobs_.push_back(Job{generation, std::move(routes), std::move(callback)});
    }
    queue_cv_.notify_one();

    spdlog::debug("StatsAggregator: queued run {}", generation);
    return generation;
}

void StatsAggregator::Wait() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return jobs_.empty() && !busy_;
    });
}

bool StatsAggregator::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return jobs_.empty() && !busy_;
    });
}

void StatsAggregator::WorkerThreadMain() {
    spdlog::debug("StatsAggregator: worker thread started");

    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return shutdown_ || !jobs_.empty();
            });

            if (jobs_.empty()) {
                break;
            }

            job = std::move(jobs_.front());
            jobs_.pop_front();
            busy_ = true;
        }

        {
            std::lock_guard<std::mutex> run_lock(run_mutex_);
            if (IsCurrent(job.generation)) {
                try {
                    Execute(job.generation, job.routes, job.callback);
                } catch (const std::exception& e) {
                    spdlog::error("StatsAggregator: run {} failed: {}", job.generation, e.what());
                }
            } else {
                spdlog::debug("StatsAggregator: skipping superseded run {}", job.generation);
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }

    spdlog::debug("StatsAggregator: worker thread exiting");
}

Snapshot StatsAggregator::Execute(Generation generation,
                                  const std::vector<Route>& routes,
                                  const SnapshotCallback& callback) {
    RunState state;
    state.generation = generation;

    // Step 1: validate
    for (const auto& route : routes) {
        if (route.GetPointCount() < constants::routes::MIN_SEGMENT_POINTS) {
            ++state.diagnostics.too_short_routes;
            continue;
        }
        if (!GeodeticCalculator::IsValidDistance(route.DistanceKm())) {
            state.diagnostics.Record(DataIssue::INVALID_DISTANCE);
            spdlog::debug("StatsAggregator: route {} has an invalid distance", route.GetId());
            continue;
        }
        state.accepted.push_back(&route);
        state.total_km += route.DistanceKm();
    }

    if (state.diagnostics.DiscardedRoutes() > 0) {
        spdlog::warn("StatsAggregator: discarded {} routes ({} too short, {} invalid distance)",
                     state.diagnostics.DiscardedRoutes(),
                     state.diagnostics.too_short_routes,
                     state.diagnostics.invalid_distance_routes);
    }

    spdlog::info("StatsAggregator: run {} started, {} of {} routes accepted, {:.3f} km",
                 generation, state.accepted.size(), routes.size(), state.total_km);

    if (state.accepted.empty()) {
        Snapshot final_snapshot = BuildSnapshot(state, true);
        Publish(final_snapshot, callback);
        return final_snapshot;
    }

    // Step 2: cache
    GeoCache cache(storage_);
    const GeoCacheLoadReport load_report = cache.Load();
    state.diagnostics.Record(DataIssue::CORRUPTED_CACHE, load_report.corrupted_maps);
    state.diagnostics.renamed_cache_countries = load_report.cleanup.renamed_countries;
    state.diagnostics.removed_cache_orphans = load_report.cleanup.removed_orphans;

    // Step 3: geocode and tally
    const bool concurrent = config_.max_concurrent_lookups > 1;
    if (concurrent && !provider_->IsThreadSafe()) {
        spdlog::warn("StatsAggregator: provider '{}' is not thread-safe, using sequential lookups",
                     provider_->GetName());
        ProcessSequential(state, cache, callback);
    } else if (concurrent) {
        ProcessConcurrent(state, cache, callback);
    } else {
        ProcessSequential(state, cache, callback);
    }

    if (state.superseded) {
        if (!cache.Save()) {
            spdlog::warn("StatsAggregator: superseded run {} could not persist the geocode cache",
                         generation);
        }
        spdlog::info("StatsAggregator: run {} superseded after {} of {} routes",
                     generation, state.processed, state.accepted.size());
        return BuildSnapshot(state, false);
    }

    // Step 4: remainder bucket
    const double remainder = state.total_km - state.countries.Sum();
    if (remainder > constants::aggregator::UNKNOWN_BUCKET_EPSILON_KM) {
        if (!state.countries.Add(constants::aggregator::UNKNOWN_BUCKET_LABEL, remainder)) {
            spdlog::warn("StatsAggregator: run {} has an unusable remainder of {} km",
                         generation, remainder);
        }
    }

    // Step 5: persist
    if (!cache.Save()) {
        spdlog::warn("StatsAggregator: run {} could not persist the geocode cache", generation);
    }

    // Step 6: final snapshot
    state.processed = state.accepted.size();
    Snapshot final_snapshot = BuildSnapshot(state, true);
    Publish(final_snapshot, callback);

    spdlog::info("StatsAggregator: run {} finished, {:.3f} km in {} countries and {} cities "
                 "({} unique coords, {} geocoded, {} cache hits)",
                 generation, final_snapshot.total_km, final_snapshot.countries.size(),
                 final_snapshot.cities.size(), final_snapshot.unique_coords,
                 final_snapshot.geocoded_count, state.diagnostics.cache_hits);

    return final_snapshot;
}

void StatsAggregator::ProcessSequential(RunState& state, GeoCache& cache,
                                        const SnapshotCallback& callback) {
    const std::size_t total = state.accepted.size();

    for (const Route* route : state.accepted) {
        if (!IsCurrent(state.generation)) {
            state.superseded = true;
            return;
        }

        if (!route->HasValidCoordinates()) {
            state.diagnostics.Record(DataIssue::INVALID_COORDINATE);
            spdlog::warn("StatsAggregator: route {} has invalid coordinates, skipped", route->GetId());
        } else {
            const RouteSample sample = sampler_.Sample(route->GetCoordinates(), route->DistanceKm());

            for (std::size_t i = 0; i < sample.Size(); ++i) {
                const auto& point = sample.points[i];
                const std::string key = GeoCache::MakeKey(point.latitude, point.longitude);
                state.seen_keys.insert(key);

                const auto cached = cache.Get(key);
                if (cached) {
                    ++state.diagnostics.cache_hits;
                    TallySample(state, cached->country, cached->city, sample.shares_km[i]);
                    continue;
                }

                const GeocodeLookup lookup = Lookup(point.latitude, point.longitude);
                if (!lookup.success) {
                    state.diagnostics.Record(DataIssue::NETWORK_GEOCODE_FAILURE);
                    spdlog::debug("StatsAggregator: lookup of {} failed ({}): {}",
                                  key, GeocodeErrorName(lookup.error), lookup.error_message);
                    continue;
                }

                cache.Put(key, lookup.result.country, lookup.result.city);
                state.geocoded_keys.insert(key);
                TallySample(state, NormalizeCountryName(lookup.result.country),
                            lookup.result.city, sample.shares_km[i]);
            }
        }

        ++state.processed;
        if (state.processed % config_.publish_interval_routes == 0 && state.processed < total) {
            Publish(BuildSnapshot(state, false), callback);
        }
    }
}

void StatsAggregator::ProcessConcurrent(RunState& state, GeoCache& cache,
                                        const SnapshotCallback& callback) {
    const std::size_t total = state.accepted.size();

    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<std::size_t> remaining;
        std::size_t outstanding = 0;
    } shared;
    shared.remaining.assign(total, 0);

    std::vector<RouteSample> samples(total);
    std::size_t task_count = 0;
    for (std::size_t r = 0; r < total; ++r) {
        const Route* route = state.accepted[r];
        if (!route->HasValidCoordinates()) {
            continue;
        }
        samples[r] = sampler_.Sample(route->GetCoordinates(), route->DistanceKm());
        shared.remaining[r] = samples[r].Size();
        task_count += samples[r].Size();
    }

    // Routes without lookups complete immediately
    for (std::size_t r = 0; r < total; ++r) {
        if (shared.remaining[r] > 0) {
            continue;
        }
        if (!state.accepted[r]->HasValidCoordinates()) {
            state.diagnostics.Record(DataIssue::INVALID_COORDINATE);
            spdlog::warn("StatsAggregator: route {} has invalid coordinates, skipped",
                         state.accepted[r]->GetId());
        }
        ++state.processed;
    }

    shared.outstanding = task_count;
    const std::size_t pool_size = std::min(config_.max_concurrent_lookups,
                                           std::max<std::size_t>(task_count, 1));

    spdlog::debug("StatsAggregator: run {} dispatching {} lookups over {} workers",
                  state.generation, task_count, pool_size);

    // Caller holds shared.mutex
    const auto finish = [&state, &shared](std::size_t route_index) {
        --shared.outstanding;
        if (--shared.remaining[route_index] == 0) {
            ++state.processed;
        }
        shared.cv.notify_all();
    };

    {
        ThreadPool pool(pool_size);

        for (std::size_t r = 0; r < total; ++r) {
            for (std::size_t i = 0; i < samples[r].Size(); ++i) {
                pool.Enqueue([this, &state, &shared, &cache, &samples, &finish, r, i] {
                    const auto& point = samples[r].points[i];
                    const double share = samples[r].shares_km[i];
                    const std::string key = GeoCache::MakeKey(point.latitude, point.longitude);

                    if (!IsCurrent(state.generation)) {
                        std::lock_guard<std::mutex> lock(shared.mutex);
                        finish(r);
                        return;
                    }

                    {
                        std::lock_guard<std::mutex> lock(shared.mutex);
                        state.seen_keys.insert(key);
                        const auto cached = cache.Get(key);
                        if (cached) {
                            ++state.diagnostics.cache_hits;
                            TallySample(state, cached->country, cached->city, share);
                            finish(r);
                            return;
                        }
                    }

                    const GeocodeLookup lookup = Lookup(point.latitude, point.longitude);

                    std::lock_guard<std::mutex> lock(shared.mutex);
                    if (!lookup.success) {
                        state.diagnostics.Record(DataIssue::NETWORK_GEOCODE_FAILURE);
                        spdlog::debug("StatsAggregator: lookup of {} failed ({}): {}",
                                      key, GeocodeErrorName(lookup.error), lookup.error_message);
                    } else {
                        cache.Put(key, lookup.result.country, lookup.result.city);
                        state.geocoded_keys.insert(key);
                        TallySample(state, NormalizeCountryName(lookup.result.country),
                                    lookup.result.city, share);
                    }
                    finish(r);
                });
            }
        }

        // Completion barrier; progress is published from this thread only
        std::unique_lock<std::mutex> lock(shared.mutex);
        std::size_t last_published = state.processed;
        while (shared.outstanding > 0) {
            shared.cv.wait(lock, [&] {
                return shared.outstanding == 0 ||
                       state.processed >= last_published + config_.publish_interval_routes;
            });

            if (shared.outstanding > 0 &&
                state.processed >= last_published + config_.publish_interval_routes) {
                last_published = state.processed;
                const Snapshot progress = BuildSnapshot(state, false);
                lock.unlock();
                Publish(progress, callback);
                lock.lock();
            }
        }
    }

    if (!IsCurrent(state.generation)) {
        state.superseded = true;
    }
}

void StatsAggregator::TallySample(RunState& state, const std::string& country,
                                  const std::string& city, double share_km) {
    if (country == constants::geocoder::UNKNOWN_LABEL) {
        state.diagnostics.Record(DataIssue::GEOCODE_MISS);
    } else if (!state.countries.Add(country, share_km)) {
        spdlog::warn("StatsAggregator: rejected share {} km for country {}", share_km, country);
    }
    if (!state.cities.Add(city, share_km)) {
        spdlog::warn("StatsAggregator: rejected share {} km for city {}", share_km, city);
    }
}

GeocodeLookup StatsAggregator::Lookup(double latitude, double longitude) {
    try {
        if (provider_->IsThreadSafe()) {
            return provider_->Geocode(latitude, longitude);
        }
        std::lock_guard<std::mutex> lock(provider_mutex_);
        return provider_->Geocode(latitude, longitude);
    } catch (const std::exception& e) {
        spdlog::warn("StatsAggregator: provider '{}' threw: {}", provider_->GetName(), e.what());
        return GeocodeLookup::Failure(GeocodeError::TRANSPORT, e.what());
    }
}

bool StatsAggregator::Publish(const Snapshot& snapshot, const SnapshotCallback& callback) const {
    if (!IsCurrent(snapshot.generation)) {
        return false;
    }
    if (callback) {
        callback(snapshot);
    }
    return true;
}

Snapshot StatsAggregator::BuildSnapshot(const RunState& state, bool done) const {
    Snapshot snapshot;
    snapshot.generation = state.generation;
    snapshot.total_km = state.total_km;
    snapshot.countries = state.countries.Sorted();
    snapshot.cities = state.cities.Sorted();
    snapshot.processed = state.processed;
    snapshot.total = state.accepted.size();
    snapshot.unique_coords = state.seen_keys.size();
    snapshot.geocoded_count = state.geocoded_keys.size();
    snapshot.done = done;
    snapshot.diagnostics = state.diagnostics;
    return snapshot;
}

} // namespace route_atlas
