// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/core/route_atlas_impl.h>

#include <spdlog/spdlog.h>

namespace route_atlas {

RouteAtlasImpl::RouteAtlasImpl(const Configuration& config,
                               std::shared_ptr<GeocodeProvider> provider,
                               std::shared_ptr<CacheStorage> storage)
    : config_(config)
    , provider_(std::move(provider))
    , storage_(std::move(storage))
    , loader_(MakeLoaderConfig(config))
    , aggregator_(std::make_unique<StatsAggregator>(provider_, storage_,
                                                    MakeAggregatorConfig(config))) {
    spdlog::info("RouteAtlas: created with {} geocoder, cache in {}",
                 provider_->GetName(), config_.cache_directory);
}

RouteAtlasImpl::~RouteAtlasImpl() {
    // Join the worker before the geocoder and storage go away
    aggregator_.reset();
}

RouteLoadResult RouteAtlasImpl::LoadRoutes(const std::string& file_path) {
    return loader_.LoadFile(file_path);
}

StatsAggregator::Generation RouteAtlasImpl::StartAggregation(std::vector<Route> routes,
                                                             SnapshotCallback callback) {
    return aggregator_->Start(std::move(routes), std::move(callback));
}

Snapshot RouteAtlasImpl::Aggregate(const std::vector<Route>& routes,
                                   const SnapshotCallback& callback) {
    return aggregator_->Run(routes, callback);
}

void RouteAtlasImpl::Wait() {
    aggregator_->Wait();
}

StatsAggregator& RouteAtlasImpl::GetAggregator() {
    return *aggregator_;
}

GeocodeProvider& RouteAtlasImpl::GetGeocoder() {
    return *provider_;
}

const Configuration& RouteAtlasImpl::GetConfiguration() const {
    return config_;
}

} // namespace route_atlas
