// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/stats/stats_aggregator.h>
#include <route_atlas/stats/snapshot_channel.h>
#include <route_atlas/data/geo_cache.h>
#include <route_atlas/geocoding/local_geocoder.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace route_atlas;
using route_atlas::coordinates::Geographic;

namespace {

const double kMetersPerDegree = 6371000.0 * std::acos(-1.0) / 180.0;

/**
 * @brief Straight northbound route of `points` points spaced `spacing_m` apart
 */
Route MakeRoute(const std::string& id, double latitude, double longitude,
                std::size_t points, double spacing_m = 10.0) {
    std::vector<Geographic> trace;
    for (std::size_t i = 0; i < points; ++i) {
        trace.emplace_back(latitude + static_cast<double>(i) * spacing_m / kMetersPerDegree,
                           longitude);
    }
    return Route(id, std::move(trace));
}

/**
 * @brief LocalGeocoder that counts lookups and reports a configurable
 * thread-safety flag
 */
class CountingProvider : public GeocodeProvider {
public:
    explicit CountingProvider(bool thread_safe = true) : thread_safe_(thread_safe) {}

    GeocodeLookup Geocode(double latitude, double longitude) override {
        ++calls_;
        return local_.Geocode(latitude, longitude);
    }

    std::string GetName() const override {
        return "counting";
    }

    bool IsThreadSafe() const override {
        return thread_safe_;
    }

    int GetCalls() const {
        return calls_.load();
    }

private:
    LocalGeocoder local_;
    bool thread_safe_;
    std::atomic<int> calls_{0};
};

/**
 * @brief Provider whose every lookup times out
 */
class FailingProvider : public GeocodeProvider {
public:
    GeocodeLookup Geocode(double, double) override {
        return GeocodeLookup::Failure(GeocodeError::TIMEOUT, "simulated timeout");
    }

    std::string GetName() const override {
        return "failing";
    }

    bool IsThreadSafe() const override {
        return true;
    }
};

/**
 * @brief Provider whose every lookup throws
 */
class ThrowingProvider : public GeocodeProvider {
public:
    GeocodeLookup Geocode(double, double) override {
        throw std::runtime_error("connection reset");
    }

    std::string GetName() const override {
        return "throwing";
    }

    bool IsThreadSafe() const override {
        return true;
    }
};

/**
 * @brief Provider that holds every lookup until Release() is called
 */
class GatedProvider : public GeocodeProvider {
public:
    GeocodeLookup Geocode(double latitude, double longitude) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        entered_cv_.notify_all();
        gate_cv_.wait(lock, [this] { return open_; });
        return local_.Geocode(latitude, longitude);
    }

    std::string GetName() const override {
        return "gated";
    }

    bool IsThreadSafe() const override {
        return true;
    }

    bool WaitUntilEntered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return entered_cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        gate_cv_.notify_all();
    }

private:
    LocalGeocoder local_;
    std::mutex mutex_;
    std::condition_variable entered_cv_;
    std::condition_variable gate_cv_;
    bool entered_ = false;
    bool open_ = false;
};

/// Collects every snapshot delivered to a callback
struct SnapshotRecorder {
    std::mutex mutex;
    std::vector<Snapshot> snapshots;

    SnapshotCallback Callback() {
        return [this](const Snapshot& snapshot) {
            std::lock_guard<std::mutex> lock(mutex);
            snapshots.push_back(snapshot);
        };
    }
};

std::vector<Route> MixedRoutes() {
    return {
        MakeRoute("berlin-1", 52.5200, 13.4050, 15),
        MakeRoute("berlin-2", 52.5300, 13.3900, 8),
        MakeRoute("paris", 48.8566, 2.3522, 12),
        MakeRoute("london", 51.5074, -0.1278, 30),
        MakeRoute("madrid", 40.4168, -3.7038, 6),
        MakeRoute("ocean", 0.0, 0.0, 5),
        MakeRoute("tokyo", 35.6762, 139.6503, 20),
    };
}

} // anonymous namespace

/**
 * @brief Test fixture running aggregations against in-memory storage
 */
class StatsAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<InMemoryCacheStorage>();
        provider_ = std::make_shared<CountingProvider>();
    }

    std::unique_ptr<StatsAggregator> MakeAggregator(StatsAggregatorConfig config = StatsAggregatorConfig()) {
        return std::make_unique<StatsAggregator>(provider_, storage_, config);
    }

    static void ExpectConserved(const Snapshot& snapshot) {
        EXPECT_NEAR(snapshot.total_km, snapshot.CountrySum(), 1e-9);
    }

    std::shared_ptr<InMemoryCacheStorage> storage_;
    std::shared_ptr<CountingProvider> provider_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(StatsAggregatorTest, RejectsInvalidCollaborators) {
    EXPECT_THROW(StatsAggregator(nullptr, storage_), std::invalid_argument);
    EXPECT_THROW(StatsAggregator(provider_, nullptr), std::invalid_argument);

    StatsAggregatorConfig zero_interval;
    zero_interval.publish_interval_routes = 0;
    EXPECT_THROW(StatsAggregator(provider_, storage_, zero_interval), std::invalid_argument);

    StatsAggregatorConfig zero_samples;
    zero_samples.max_samples_per_route = 0;
    EXPECT_THROW(StatsAggregator(provider_, storage_, zero_samples), std::invalid_argument);
}

// ============================================================================
// Single runs
// ============================================================================

TEST_F(StatsAggregatorTest, ShortBerlinRoute) {
    auto aggregator = MakeAggregator();
    const std::vector<Route> routes = {MakeRoute("berlin", 52.5200, 13.4050, 2, 70.0)};

    SnapshotRecorder recorder;
    const Snapshot snapshot = aggregator->Run(routes, recorder.Callback());

    EXPECT_TRUE(snapshot.done);
    EXPECT_NEAR(0.07, snapshot.total_km, 1e-6);
    ASSERT_EQ(1u, snapshot.countries.size());
    EXPECT_EQ("Germany", snapshot.countries.front().label);
    EXPECT_NEAR(0.07, snapshot.CountryKm("Germany"), 1e-9);
    ASSERT_EQ(1u, snapshot.cities.size());
    EXPECT_EQ("Berlin", snapshot.cities.front().label);
    EXPECT_NEAR(0.07, snapshot.CityKm("Berlin"), 1e-9);

    EXPECT_EQ(1u, snapshot.processed);
    EXPECT_EQ(1u, snapshot.total);
    EXPECT_EQ(snapshot.unique_coords, snapshot.geocoded_count);
    EXPECT_GE(snapshot.unique_coords, 1u);

    ASSERT_EQ(1u, recorder.snapshots.size());
    EXPECT_TRUE(recorder.snapshots.front().done);
    EXPECT_EQ(aggregator->GetCurrentGeneration(), recorder.snapshots.front().generation);
}

TEST_F(StatsAggregatorTest, EmptyRouteListFinishesImmediately) {
    auto aggregator = MakeAggregator();

    SnapshotRecorder recorder;
    const Snapshot snapshot = aggregator->Run({}, recorder.Callback());

    EXPECT_TRUE(snapshot.done);
    EXPECT_DOUBLE_EQ(0.0, snapshot.total_km);
    EXPECT_TRUE(snapshot.countries.empty());
    EXPECT_TRUE(snapshot.cities.empty());
    EXPECT_EQ(0u, snapshot.total);
    ASSERT_EQ(1u, recorder.snapshots.size());
    EXPECT_TRUE(recorder.snapshots.front().done);

    // No cache round-trip without accepted routes
    EXPECT_EQ(0u, storage_->Size());
    EXPECT_EQ(0, provider_->GetCalls());
}

TEST_F(StatsAggregatorTest, UngeocodedDistanceGoesToUnknownBucket) {
    auto aggregator = MakeAggregator();
    const std::vector<Route> routes = {
        MakeRoute("berlin", 52.5200, 13.4050, 5),
        MakeRoute("ocean", 0.0, 0.0, 5),
    };

    const Snapshot snapshot = aggregator->Run(routes);

    EXPECT_NEAR(routes[1].DistanceKm(), snapshot.CountryKm("(Unknown)"), 1e-9);
    EXPECT_NEAR(routes[0].DistanceKm(), snapshot.CountryKm("Germany"), 1e-9);
    EXPECT_DOUBLE_EQ(0.0, snapshot.CountryKm("Unknown"));
    EXPECT_NEAR(routes[1].DistanceKm(), snapshot.CityKm("Unknown"), 1e-9);
    EXPECT_EQ(5u, snapshot.diagnostics.geocode_misses);
    ExpectConserved(snapshot);
}

TEST_F(StatsAggregatorTest, NoUnknownBucketWhenEverythingResolves) {
    auto aggregator = MakeAggregator();
    const Snapshot snapshot = aggregator->Run({MakeRoute("paris", 48.8566, 2.3522, 12)});

    ASSERT_EQ(1u, snapshot.countries.size());
    EXPECT_EQ("France", snapshot.countries.front().label);
    ExpectConserved(snapshot);
}

TEST_F(StatsAggregatorTest, InvalidRoutesAreReported) {
    auto aggregator = MakeAggregator();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    const std::vector<Route> routes = {
        MakeRoute("berlin", 52.5200, 13.4050, 5),
        Route("single", {Geographic(52.52, 13.405)}),
        Route("nan", {Geographic(nan, 13.405), Geographic(52.52, 13.405)}),
        Route("polar", {Geographic(91.0, 0.0), Geographic(91.0, 0.01)}),
    };

    const Snapshot snapshot = aggregator->Run(routes);

    EXPECT_EQ(1u, snapshot.diagnostics.too_short_routes);
    EXPECT_EQ(1u, snapshot.diagnostics.invalid_distance_routes);
    EXPECT_EQ(1u, snapshot.diagnostics.invalid_coordinate_routes);
    EXPECT_EQ(2u, snapshot.diagnostics.DiscardedRoutes());

    // The out-of-range route is accepted for its distance but never geocoded
    EXPECT_EQ(2u, snapshot.total);
    EXPECT_NEAR(routes[0].DistanceKm() + routes[3].DistanceKm(), snapshot.total_km, 1e-9);
    EXPECT_NEAR(routes[3].DistanceKm(), snapshot.CountryKm("(Unknown)"), 1e-9);
    ExpectConserved(snapshot);
}

TEST_F(StatsAggregatorTest, MixedRoutesConserveDistance) {
    auto aggregator = MakeAggregator();
    const auto routes = MixedRoutes();
    const Snapshot snapshot = aggregator->Run(routes);

    EXPECT_GT(snapshot.CountryKm("Germany"), 0.0);
    EXPECT_GT(snapshot.CountryKm("France"), 0.0);
    EXPECT_GT(snapshot.CountryKm("United Kingdom"), 0.0);
    EXPECT_GT(snapshot.CountryKm("Spain"), 0.0);
    EXPECT_GT(snapshot.CountryKm("Japan"), 0.0);
    EXPECT_GT(snapshot.CountryKm("(Unknown)"), 0.0);
    ExpectConserved(snapshot);

    // Lists are sorted by distance
    for (std::size_t i = 1; i < snapshot.countries.size(); ++i) {
        EXPECT_GE(snapshot.countries[i - 1].km, snapshot.countries[i].km);
    }
    for (std::size_t i = 1; i < snapshot.cities.size(); ++i) {
        EXPECT_GE(snapshot.cities[i - 1].km, snapshot.cities[i].km);
    }
}

TEST_F(StatsAggregatorTest, SpacingWeightedConservesDistance) {
    StatsAggregatorConfig config;
    config.attribution = DistanceAttribution::SPACING_WEIGHTED;
    config.max_samples_per_route = 4;
    auto aggregator = MakeAggregator(config);

    const Snapshot snapshot = aggregator->Run(MixedRoutes());
    ExpectConserved(snapshot);
}

// ============================================================================
// Cache behaviour
// ============================================================================

TEST_F(StatsAggregatorTest, SecondRunIsServedFromCache) {
    auto aggregator = MakeAggregator();
    const auto routes = MixedRoutes();

    const Snapshot first = aggregator->Run(routes);
    const int calls_after_first = provider_->GetCalls();
    EXPECT_GT(calls_after_first, 0);
    EXPECT_GT(first.geocoded_count, 0u);
    EXPECT_EQ(StorageReadStatus::FOUND, storage_->Get("coordCountryCache").status);
    EXPECT_EQ(StorageReadStatus::FOUND, storage_->Get("coordCityCache").status);

    const Snapshot second = aggregator->Run(routes);
    EXPECT_EQ(calls_after_first, provider_->GetCalls());
    EXPECT_EQ(0u, second.geocoded_count);
    EXPECT_EQ(first.unique_coords, second.unique_coords);
    EXPECT_GT(second.diagnostics.cache_hits, 0u);

    ASSERT_EQ(first.countries.size(), second.countries.size());
    for (const auto& entry : first.countries) {
        EXPECT_NEAR(entry.km, second.CountryKm(entry.label), 1e-9) << entry.label;
    }
}

TEST_F(StatsAggregatorTest, CachedAliasesAreNormalizedOnLoad) {
    const std::string key = GeoCache::MakeKey(52.5200, 13.4050);
    ASSERT_TRUE(storage_->Set("coordCountryCache", nlohmann::json{{key, "Deutschland"}}.dump()));
    ASSERT_TRUE(storage_->Set("coordCityCache", nlohmann::json{{key, "Berlin"}}.dump()));

    auto aggregator = MakeAggregator();
    // Both points fall into the seeded cell
    const Snapshot snapshot = aggregator->Run({MakeRoute("berlin", 52.5200, 13.4050, 2, 30.0)});

    EXPECT_EQ(0, provider_->GetCalls());
    EXPECT_EQ(1u, snapshot.diagnostics.renamed_cache_countries);
    EXPECT_NEAR(snapshot.total_km, snapshot.CountryKm("Germany"), 1e-9);
    EXPECT_DOUBLE_EQ(0.0, snapshot.CountryKm("Deutschland"));

    const auto stored = nlohmann::json::parse(storage_->Get("coordCountryCache").payload);
    EXPECT_EQ("Germany", stored[key].get<std::string>());
}

TEST_F(StatsAggregatorTest, CorruptedCacheIsRebuilt) {
    ASSERT_TRUE(storage_->Set("coordCountryCache", "definitely not json"));

    auto aggregator = MakeAggregator();
    const Snapshot snapshot = aggregator->Run({MakeRoute("berlin", 52.5200, 13.4050, 5)});

    EXPECT_TRUE(snapshot.done);
    EXPECT_EQ(1u, snapshot.diagnostics.corrupted_cache_maps);
    EXPECT_GT(snapshot.CountryKm("Germany"), 0.0);

    const auto stored = nlohmann::json::parse(storage_->Get("coordCountryCache").payload, nullptr, false);
    ASSERT_FALSE(stored.is_discarded());
    EXPECT_TRUE(stored.is_object());
}

TEST_F(StatsAggregatorTest, FailedLookupsLeaveDistanceUnlocated) {
    StatsAggregator aggregator(std::make_shared<FailingProvider>(), storage_);
    const std::vector<Route> routes = {MakeRoute("berlin", 52.5200, 13.4050, 5)};

    const Snapshot snapshot = aggregator.Run(routes);

    EXPECT_TRUE(snapshot.done);
    EXPECT_EQ(5u, snapshot.diagnostics.network_failures);
    EXPECT_EQ(0u, snapshot.geocoded_count);
    EXPECT_TRUE(snapshot.cities.empty());
    ASSERT_EQ(1u, snapshot.countries.size());
    EXPECT_EQ("(Unknown)", snapshot.countries.front().label);
    ExpectConserved(snapshot);
}

// ============================================================================
// Progress
// ============================================================================

TEST_F(StatsAggregatorTest, ProgressSnapshotsAtPublishInterval) {
    auto aggregator = MakeAggregator();
    std::vector<Route> routes;
    for (int i = 0; i < 25; ++i) {
        routes.push_back(MakeRoute("r" + std::to_string(i), 52.5200, 13.4050, 3));
    }

    SnapshotRecorder recorder;
    aggregator->Run(routes, recorder.Callback());

    ASSERT_EQ(3u, recorder.snapshots.size());
    EXPECT_EQ(10u, recorder.snapshots[0].processed);
    EXPECT_EQ(20u, recorder.snapshots[1].processed);
    EXPECT_EQ(25u, recorder.snapshots[2].processed);
    EXPECT_FALSE(recorder.snapshots[0].done);
    EXPECT_FALSE(recorder.snapshots[1].done);
    EXPECT_TRUE(recorder.snapshots[2].done);

    for (const auto& snapshot : recorder.snapshots) {
        EXPECT_EQ(25u, snapshot.total);
        EXPECT_EQ(recorder.snapshots.back().generation, snapshot.generation);
    }
    EXPECT_LE(recorder.snapshots[0].CountrySum(), recorder.snapshots[1].CountrySum());
}

// ============================================================================
// Concurrent lookups
// ============================================================================

TEST_F(StatsAggregatorTest, ConcurrentMatchesSequential) {
    const auto routes = MixedRoutes();

    const Snapshot sequential = MakeAggregator()->Run(routes);

    auto concurrent_storage = std::make_shared<InMemoryCacheStorage>();
    StatsAggregatorConfig config;
    config.max_concurrent_lookups = 4;
    config.publish_interval_routes = 2;
    StatsAggregator aggregator(std::make_shared<CountingProvider>(), concurrent_storage, config);

    SnapshotRecorder recorder;
    const Snapshot concurrent = aggregator.Run(routes, recorder.Callback());

    EXPECT_TRUE(concurrent.done);
    EXPECT_EQ(routes.size(), concurrent.processed);
    EXPECT_NEAR(sequential.total_km, concurrent.total_km, 1e-9);
    EXPECT_EQ(sequential.unique_coords, concurrent.unique_coords);
    EXPECT_EQ(sequential.geocoded_count, concurrent.geocoded_count);
    EXPECT_EQ(sequential.diagnostics.geocode_misses, concurrent.diagnostics.geocode_misses);

    ASSERT_EQ(sequential.countries.size(), concurrent.countries.size());
    for (const auto& entry : sequential.countries) {
        EXPECT_NEAR(entry.km, concurrent.CountryKm(entry.label), 1e-9) << entry.label;
    }
    ASSERT_EQ(sequential.cities.size(), concurrent.cities.size());
    for (const auto& entry : sequential.cities) {
        EXPECT_NEAR(entry.km, concurrent.CityKm(entry.label), 1e-9) << entry.label;
    }

    // Progress is monotonic and only the last snapshot is final
    ASSERT_FALSE(recorder.snapshots.empty());
    for (std::size_t i = 1; i < recorder.snapshots.size(); ++i) {
        EXPECT_GE(recorder.snapshots[i].processed, recorder.snapshots[i - 1].processed);
        EXPECT_FALSE(recorder.snapshots[i - 1].done);
    }
    EXPECT_TRUE(recorder.snapshots.back().done);
}

TEST_F(StatsAggregatorTest, ConcurrentRequestWithUnsafeProviderRunsSequentially) {
    StatsAggregatorConfig config;
    config.max_concurrent_lookups = 8;
    auto unsafe = std::make_shared<CountingProvider>(false);
    StatsAggregator aggregator(unsafe, storage_, config);

    const Snapshot snapshot = aggregator.Run(MixedRoutes());
    EXPECT_TRUE(snapshot.done);
    EXPECT_EQ(static_cast<int>(snapshot.geocoded_count), unsafe->GetCalls());
    ExpectConserved(snapshot);
}

TEST_F(StatsAggregatorTest, ConcurrentFailuresAreCounted) {
    StatsAggregatorConfig config;
    config.max_concurrent_lookups = 3;
    StatsAggregator aggregator(std::make_shared<FailingProvider>(), storage_, config);

    const Snapshot snapshot = aggregator.Run({MakeRoute("berlin", 52.5200, 13.4050, 6),
                                              MakeRoute("paris", 48.8566, 2.3522, 4)});
    EXPECT_EQ(10u, snapshot.diagnostics.network_failures);
    EXPECT_EQ(2u, snapshot.processed);
    ExpectConserved(snapshot);
}

TEST_F(StatsAggregatorTest, ThrowingProviderCountsAsFailedLookup) {
    const std::vector<Route> routes = {MakeRoute("berlin", 52.5200, 13.4050, 6),
                                       MakeRoute("paris", 48.8566, 2.3522, 4)};

    StatsAggregator sequential(std::make_shared<ThrowingProvider>(), storage_);
    const Snapshot sequential_snapshot = sequential.Run(routes);
    EXPECT_TRUE(sequential_snapshot.done);
    EXPECT_EQ(10u, sequential_snapshot.diagnostics.network_failures);
    ExpectConserved(sequential_snapshot);

    StatsAggregatorConfig config;
    config.max_concurrent_lookups = 3;
    StatsAggregator concurrent(std::make_shared<ThrowingProvider>(), storage_, config);
    const Snapshot concurrent_snapshot = concurrent.Run(routes);
    EXPECT_TRUE(concurrent_snapshot.done);
    EXPECT_EQ(10u, concurrent_snapshot.diagnostics.network_failures);
    EXPECT_EQ(2u, concurrent_snapshot.processed);
    ExpectConserved(concurrent_snapshot);
}

// ============================================================================
// Background runs and generations
// ============================================================================

TEST_F(StatsAggregatorTest, StartPublishesOnWorkerThread) {
    auto aggregator = MakeAggregator();
    SnapshotChannel channel;

    const auto generation = aggregator->Start(MixedRoutes(), channel.MakeCallback());
    ASSERT_TRUE(aggregator->WaitFor(std::chrono::seconds(10)));

    auto latest = channel.PopLatest();
    ASSERT_TRUE(latest.has_value());
    EXPECT_TRUE(latest->done);
    EXPECT_EQ(generation, latest->generation);
    EXPECT_TRUE(aggregator->IsCurrent(generation));
}

TEST_F(StatsAggregatorTest, NewerRunSupersedesOlderRun) {
    auto gated = std::make_shared<GatedProvider>();
    StatsAggregator aggregator(gated, storage_);

    SnapshotChannel first_channel;
    SnapshotChannel second_channel;

    std::vector<Route> first_routes;
    for (int i = 0; i < 5; ++i) {
        first_routes.push_back(MakeRoute("old" + std::to_string(i), 48.8566 + 0.01 * i, 2.3522, 4));
    }

    const auto first = aggregator.Start(first_routes, first_channel.MakeCallback());
    ASSERT_TRUE(gated->WaitUntilEntered(std::chrono::seconds(10)));

    const auto second = aggregator.Start({MakeRoute("new", 52.5200, 13.4050, 4)},
                                         second_channel.MakeCallback());
    EXPECT_GT(second, first);
    EXPECT_FALSE(aggregator.IsCurrent(first));

    gated->Release();
    aggregator.Wait();

    // The superseded run published nothing
    EXPECT_TRUE(first_channel.Empty());

    auto result = second_channel.PopLatest();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->done);
    EXPECT_EQ(second, result->generation);
    EXPECT_GT(result->CountryKm("Germany"), 0.0);
    EXPECT_DOUBLE_EQ(0.0, result->CountryKm("France"));

    // Lookups of the superseded run were persisted
    GeoCache cache(storage_);
    cache.Load();
    EXPECT_TRUE(cache.Get(GeoCache::MakeKey(48.8566, 2.3522)).has_value());
}

TEST_F(StatsAggregatorTest, RunSupersedesQueuedStart) {
    auto gated = std::make_shared<GatedProvider>();
    StatsAggregator aggregator(gated, storage_);

    SnapshotChannel queued_channel;
    const auto queued = aggregator.Start({MakeRoute("paris", 48.8566, 2.3522, 3)},
                                         queued_channel.MakeCallback());
    ASSERT_TRUE(gated->WaitUntilEntered(std::chrono::seconds(10)));

    // Open the gate once Run() has taken its generation
    std::thread releaser([&aggregator, &gated, queued] {
        while (aggregator.GetCurrentGeneration() == queued) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        gated->Release();
    });

    SnapshotRecorder recorder;
    const Snapshot snapshot = aggregator.Run({MakeRoute("berlin", 52.5200, 13.4050, 3)},
                                             recorder.Callback());
    releaser.join();
    aggregator.Wait();

    EXPECT_TRUE(snapshot.done);
    EXPECT_GT(snapshot.generation, queued);
    ASSERT_EQ(1u, recorder.snapshots.size());
    EXPECT_GT(snapshot.CountryKm("Germany"), 0.0);
    EXPECT_TRUE(queued_channel.Empty());

    // Both runs' lookups survive in the persisted cache
    GeoCache cache(storage_);
    cache.Load();
    EXPECT_TRUE(cache.Get(GeoCache::MakeKey(48.8566, 2.3522)).has_value());
    EXPECT_TRUE(cache.Get(GeoCache::MakeKey(52.5200, 13.4050)).has_value());
}

TEST_F(StatsAggregatorTest, RunFromWorkerCallbackThrows) {
    StatsAggregator aggregator(provider_, storage_);

    std::atomic<bool> threw{false};
    aggregator.Start({MakeRoute("berlin", 52.5200, 13.4050, 3)},
                     [&aggregator, &threw](const Snapshot& snapshot) {
                         if (!snapshot.done) {
                             return;
                         }
                         try {
                             aggregator.Run({});
                         } catch (const std::logic_error&) {
                             threw = true;
                         }
                     });
    aggregator.Wait();

    EXPECT_TRUE(threw.load());
}
