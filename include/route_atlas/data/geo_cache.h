// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file geo_cache.h
 * @brief Persistent coordinate to country/city memo
 *
 * Geocode results are memoized per quantized grid cell (3 decimals, about
 * 110 m). The cache is two flat string maps, one for countries and one for
 * cities, persisted through a CacheStorage port as JSON objects.
 */

#include "cache_storage.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace route_atlas {

/// Country/city pair stored for one grid cell
struct CachedLocation {
    std::string country;
    std::string city;
};

/// Summary of a Cleanup pass
struct GeoCacheCleanupReport {
    std::size_t renamed_countries;  ///< Country values rewritten by normalization
    std::size_t removed_orphans;    ///< City entries dropped for lack of a country

    GeoCacheCleanupReport() : renamed_countries(0), removed_orphans(0) {}
};

/// Summary of a Load
struct GeoCacheLoadReport {
    std::size_t country_entries;   ///< Country entries after cleanup
    std::size_t city_entries;      ///< City entries after cleanup
    std::size_t corrupted_maps;    ///< Maps discarded because they were unreadable (0-2)
    GeoCacheCleanupReport cleanup;

    GeoCacheLoadReport() : country_entries(0), city_entries(0), corrupted_maps(0) {}
};

/// Lookup statistics since construction
struct GeoCacheStats {
    std::size_t hits;
    std::size_t misses;
    std::size_t writes;
    std::size_t saves;

    GeoCacheStats() : hits(0), misses(0), writes(0), saves(0) {}

    double GetHitRatio() const {
        const std::size_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }
};

/// Coordinate-keyed geocode memo.
/// Not synchronized; callers that share an instance between threads guard it
/// themselves.
class GeoCache {
public:
    /// @throws std::invalid_argument if storage is null
    explicit GeoCache(std::shared_ptr<CacheStorage> storage);

    /// Replace the in-memory maps with the persisted ones and run Cleanup.
    /// Missing maps start empty; undecodable or wrongly shaped maps are
    /// discarded and counted in the report.
    GeoCacheLoadReport Load();

    /// Renormalize every country value and drop city entries whose key has
    /// no country entry
    GeoCacheCleanupReport Cleanup();

    /// Cached pair for key; city is "Unknown" when only a country is stored
    [[nodiscard]] std::optional<CachedLocation> Get(const std::string& key);

    /// Store a pair in memory; the country is normalized first
    void Put(const std::string& key, const std::string& country, const std::string& city);

    /// Overwrite both persisted maps with the in-memory state
    /// @return True if both maps were written
    bool Save();

    /// Drop every in-memory entry (persisted maps are untouched until Save)
    void Clear();

    /// Quantized cache key "lat,lon" with three decimals
    [[nodiscard]] static std::string MakeKey(double latitude, double longitude);

    [[nodiscard]] std::size_t GetCountryEntryCount() const noexcept {
        return countries_.size();
    }

    [[nodiscard]] std::size_t GetCityEntryCount() const noexcept {
        return cities_.size();
    }

    [[nodiscard]] const GeoCacheStats& GetStats() const noexcept {
        return stats_;
    }

private:
    using StringMap = std::unordered_map<std::string, std::string>;

    /// Decode one persisted map; nullopt if it must be discarded
    std::optional<StringMap> LoadMap(const std::string& storage_key) const;

    bool SaveMap(const std::string& storage_key, const StringMap& map);

    std::shared_ptr<CacheStorage> storage_;
    StringMap countries_;
    StringMap cities_;
    GeoCacheStats stats_;
};

} // namespace route_atlas
