// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/route_atlas.h>
#include <route_atlas/core/route_atlas_impl.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>

namespace route_atlas {

std::unique_ptr<RouteAtlas> RouteAtlas::Create(const Configuration& config) {
    std::string error_message;
    if (!ValidateConfiguration(config, error_message)) {
        spdlog::error("RouteAtlas: invalid configuration: {}", error_message);
        return nullptr;
    }

    std::shared_ptr<CacheStorage> storage = CacheStorage::CreateFileBacked(config.cache_directory);
    if (!storage) {
        spdlog::error("RouteAtlas: cannot use cache directory {}", config.cache_directory);
        return nullptr;
    }

    std::shared_ptr<GeocodeProvider> provider;
    if (config.geocoder == GeocoderKind::NETWORK) {
        provider = std::make_shared<NetworkGeocoder>(config.network);
    } else {
        provider = std::make_shared<LocalGeocoder>(GeoDatabase::Default(), config.country_match);
    }

    try {
        return std::make_unique<RouteAtlasImpl>(config, std::move(provider), std::move(storage));
    } catch (const std::invalid_argument& e) {
        spdlog::error("RouteAtlas: initialization failed: {}", e.what());
        return nullptr;
    }
}

} // namespace route_atlas
