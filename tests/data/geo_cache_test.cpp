// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/data/geo_cache.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>

namespace route_atlas {
namespace {

/// Test fixture for GeoCache over in-memory storage
class GeoCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<InMemoryCacheStorage>();
    }

    void Seed(const char* storage_key, const nlohmann::json& map) {
        ASSERT_TRUE(storage_->Set(storage_key, map.dump()));
    }

    nlohmann::json Stored(const char* storage_key) const {
        const StorageReadResult read = storage_->Get(storage_key);
        EXPECT_EQ(StorageReadStatus::FOUND, read.status);
        return nlohmann::json::parse(read.payload);
    }

    std::shared_ptr<InMemoryCacheStorage> storage_;
};

TEST_F(GeoCacheTest, RejectsNullStorage) {
    EXPECT_THROW(GeoCache(nullptr), std::invalid_argument);
}

TEST_F(GeoCacheTest, MakeKeyQuantizesToThreeDecimals) {
    EXPECT_EQ("52.520,13.405", GeoCache::MakeKey(52.52, 13.405));
    EXPECT_EQ("52.520,13.405", GeoCache::MakeKey(52.52012, 13.40488));
    EXPECT_EQ("-33.869,151.209", GeoCache::MakeKey(-33.8688, 151.2093));
    EXPECT_EQ("0.000,0.000", GeoCache::MakeKey(0.0, 0.0));
}

TEST_F(GeoCacheTest, LoadFromEmptyStorage) {
    GeoCache cache(storage_);
    const GeoCacheLoadReport report = cache.Load();
    EXPECT_EQ(0u, report.country_entries);
    EXPECT_EQ(0u, report.city_entries);
    EXPECT_EQ(0u, report.corrupted_maps);
    EXPECT_FALSE(cache.Get("52.520,13.405").has_value());
}

TEST_F(GeoCacheTest, CleanupNormalizesCountryAliases) {
    Seed("coordCountryCache", {{"52.520,13.405", "Deutschland"}});
    Seed("coordCityCache", {{"52.520,13.405", "Berlin"}});

    GeoCache cache(storage_);
    const GeoCacheLoadReport report = cache.Load();
    EXPECT_EQ(1u, report.cleanup.renamed_countries);

    const auto location = cache.Get("52.520,13.405");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ("Germany", location->country);
    EXPECT_EQ("Berlin", location->city);

    // Cleanup is idempotent
    const GeoCacheCleanupReport again = cache.Cleanup();
    EXPECT_EQ(0u, again.renamed_countries);
    EXPECT_EQ(0u, again.removed_orphans);
}

TEST_F(GeoCacheTest, CleanupRemovesOrphanCities) {
    Seed("coordCountryCache", {{"48.857,2.352", "France"}});
    Seed("coordCityCache", {{"48.857,2.352", "Paris"}, {"1.000,1.000", "Nowhere"}});

    GeoCache cache(storage_);
    const GeoCacheLoadReport report = cache.Load();
    EXPECT_EQ(1u, report.cleanup.removed_orphans);
    EXPECT_EQ(1u, report.country_entries);
    EXPECT_EQ(1u, report.city_entries);
}

TEST_F(GeoCacheTest, MissingCityDefaultsToUnknown) {
    Seed("coordCountryCache", {{"35.690,139.692", "Japan"}});

    GeoCache cache(storage_);
    cache.Load();
    const auto location = cache.Get("35.690,139.692");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ("Japan", location->country);
    EXPECT_EQ("Unknown", location->city);
}

TEST_F(GeoCacheTest, CorruptedMapIsDiscardedIndependently) {
    ASSERT_TRUE(storage_->Set("coordCountryCache", "{not json"));
    Seed("coordCityCache", {{"48.857,2.352", "Paris"}});

    GeoCache cache(storage_);
    const GeoCacheLoadReport report = cache.Load();
    EXPECT_EQ(1u, report.corrupted_maps);
    EXPECT_EQ(0u, report.country_entries);
    // Without a country entry the city becomes an orphan
    EXPECT_EQ(1u, report.cleanup.removed_orphans);
    EXPECT_EQ(0u, report.city_entries);
}

TEST_F(GeoCacheTest, NonStringValuesDiscardTheMap) {
    Seed("coordCountryCache", {{"48.857,2.352", "France"}});
    Seed("coordCityCache", {{"48.857,2.352", 42}});

    GeoCache cache(storage_);
    const GeoCacheLoadReport report = cache.Load();
    EXPECT_EQ(1u, report.corrupted_maps);
    EXPECT_EQ(1u, report.country_entries);
    EXPECT_EQ(0u, report.city_entries);
}

TEST_F(GeoCacheTest, ArrayInPlaceOfObjectIsCorrupted) {
    ASSERT_TRUE(storage_->Set("coordCountryCache", "[1, 2, 3]"));
    ASSERT_TRUE(storage_->Set("coordCityCache", "\"text\""));

    GeoCache cache(storage_);
    EXPECT_EQ(2u, cache.Load().corrupted_maps);
}

TEST_F(GeoCacheTest, PutNormalizesAndSaveWritesBothMaps) {
    GeoCache cache(storage_);
    cache.Load();
    cache.Put("51.507,-0.128", "England", "London");

    const auto location = cache.Get("51.507,-0.128");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ("United Kingdom", location->country);

    ASSERT_TRUE(cache.Save());
    EXPECT_EQ("United Kingdom", Stored("coordCountryCache")["51.507,-0.128"]);
    EXPECT_EQ("London", Stored("coordCityCache")["51.507,-0.128"]);
}

TEST_F(GeoCacheTest, SaveAndReload) {
    {
        GeoCache cache(storage_);
        cache.Load();
        cache.Put("52.520,13.405", "Germany", "Berlin");
        cache.Put("48.857,2.352", "France", "Paris");
        ASSERT_TRUE(cache.Save());
    }

    GeoCache reloaded(storage_);
    const GeoCacheLoadReport report = reloaded.Load();
    EXPECT_EQ(2u, report.country_entries);
    EXPECT_EQ(2u, report.city_entries);
    EXPECT_EQ("Paris", reloaded.Get("48.857,2.352")->city);
}

TEST_F(GeoCacheTest, StatsCountHitsAndMisses) {
    GeoCache cache(storage_);
    cache.Put("52.520,13.405", "Germany", "Berlin");

    (void)cache.Get("52.520,13.405");
    (void)cache.Get("52.520,13.405");
    (void)cache.Get("0.000,0.000");

    const GeoCacheStats& stats = cache.GetStats();
    EXPECT_EQ(2u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_EQ(1u, stats.writes);
    EXPECT_NEAR(2.0 / 3.0, stats.GetHitRatio(), 1e-12);
}

TEST_F(GeoCacheTest, ClearEmptiesMemoryOnly) {
    GeoCache cache(storage_);
    cache.Put("52.520,13.405", "Germany", "Berlin");
    ASSERT_TRUE(cache.Save());

    cache.Clear();
    EXPECT_EQ(0u, cache.GetCountryEntryCount());
    EXPECT_EQ(0u, cache.GetCityEntryCount());

    cache.Load();
    EXPECT_EQ(1u, cache.GetCountryEntryCount());
}

/// Storage whose writes always fail
class ReadOnlyStorage : public InMemoryCacheStorage {
public:
    bool Set(const std::string&, const std::string&) override {
        return false;
    }
};

TEST_F(GeoCacheTest, SaveReportsStorageFailure) {
    GeoCache cache(std::make_shared<ReadOnlyStorage>());
    cache.Put("52.520,13.405", "Germany", "Berlin");
    EXPECT_FALSE(cache.Save());
}

} // namespace
} // namespace route_atlas
