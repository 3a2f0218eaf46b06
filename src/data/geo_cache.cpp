// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/data/geo_cache.h>
#include <route_atlas/geocoding/country_names.h>
#include <route_atlas/constants.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace route_atlas {

GeoCache::GeoCache(std::shared_ptr<CacheStorage> storage)
    : storage_(std::move(storage)) {
    if (!storage_) {
        throw std::invalid_argument("GeoCache: storage must not be null");
    }
}

std::string GeoCache::MakeKey(double latitude, double longitude) {
    return fmt::format("{:.3f},{:.3f}", latitude, longitude);
}

std::optional<GeoCache::StringMap> GeoCache::LoadMap(const std::string& storage_key) const {
    const StorageReadResult read = storage_->Get(storage_key);

    switch (read.status) {
        case StorageReadStatus::MISSING:
            return StringMap();
        case StorageReadStatus::TYPE_MISMATCH:
            spdlog::warn("GeoCache: {} has an unexpected type, discarding", storage_key);
            return std::nullopt;
        case StorageReadStatus::FOUND:
            break;
    }

    const nlohmann::json document = nlohmann::json::parse(read.payload, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::warn("GeoCache: {} is not a JSON object, discarding", storage_key);
        return std::nullopt;
    }

    StringMap map;
    map.reserve(document.size());
    for (auto it = document.begin(); it != document.end(); ++it) {
        if (!it.value().is_string()) {
            spdlog::warn("GeoCache: {} has a non-string value at {}, discarding",
                         storage_key, it.key());
            return std::nullopt;
        }
        map.emplace(it.key(), it.value().get<std::string>());
    }

    return map;
}

GeoCacheLoadReport GeoCache::Load() {
    GeoCacheLoadReport report;

    auto countries = LoadMap(constants::cache::COUNTRY_MAP_KEY);
    if (!countries) {
        ++report.corrupted_maps;
    }
    auto cities = LoadMap(constants::cache::CITY_MAP_KEY);
    if (!cities) {
        ++report.corrupted_maps;
    }

    countries_ = countries ? std::move(*countries) : StringMap();
    cities_ = cities ? std::move(*cities) : StringMap();

    report.cleanup = Cleanup();
    report.country_entries = countries_.size();
    report.city_entries = cities_.size();

    spdlog::info("GeoCache: loaded {} countries, {} cities ({} renamed, {} orphans removed, {} maps discarded)",
                 report.country_entries, report.city_entries,
                 report.cleanup.renamed_countries, report.cleanup.removed_orphans,
                 report.corrupted_maps);
    return report;
}

GeoCacheCleanupReport GeoCache::Cleanup() {
    GeoCacheCleanupReport report;

    for (auto& entry : countries_) {
        std::string normalized = NormalizeCountryName(entry.second);
        if (normalized != entry.second) {
            entry.second = std::move(normalized);
            ++report.renamed_countries;
        }
    }

    for (auto it = cities_.begin(); it != cities_.end();) {
        if (countries_.find(it->first) == countries_.end()) {
            it = cities_.erase(it);
            ++report.removed_orphans;
        } else {
            ++it;
        }
    }

    return report;
}

std::optional<CachedLocation> GeoCache::Get(const std::string& key) {
    const auto country = countries_.find(key);
    if (country == countries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }

    ++stats_.hits;
    CachedLocation location;
    location.country = country->second;

    const auto city = cities_.find(key);
    location.city = city != cities_.end() ? city->second
                                          : std::string(constants::geocoder::UNKNOWN_LABEL);
    return location;
}

void GeoCache::Put(const std::string& key, const std::string& country, const std::string& city) {
    countries_[key] = NormalizeCountryName(country);
    cities_[key] = city;
    ++stats_.writes;
}

bool GeoCache::SaveMap(const std::string& storage_key, const StringMap& map) {
    nlohmann::json document = nlohmann::json::object();
    for (const auto& entry : map) {
        document[entry.first] = entry.second;
    }

    // Replace invalid UTF-8 rather than throwing from dump()
    const std::string payload =
        document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    if (!storage_->Set(storage_key, payload)) {
        spdlog::error("GeoCache: failed to save {}", storage_key);
        return false;
    }
    return true;
}

bool GeoCache::Save() {
    const bool countries_saved = SaveMap(constants::cache::COUNTRY_MAP_KEY, countries_);
    const bool cities_saved = SaveMap(constants::cache::CITY_MAP_KEY, cities_);
    ++stats_.saves;

    spdlog::debug("GeoCache: saved {} countries, {} cities", countries_.size(), cities_.size());
    return countries_saved && cities_saved;
}

void GeoCache::Clear() {
    countries_.clear();
    cities_.clear();
}

} // namespace route_atlas
