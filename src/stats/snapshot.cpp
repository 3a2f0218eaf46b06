// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/stats/snapshot.h>

namespace route_atlas {

namespace {

double FindKm(const std::vector<TallyEntry>& entries, const std::string& label) {
    for (const auto& entry : entries) {
        if (entry.label == label) {
            return entry.km;
        }
    }
    return 0.0;
}

} // anonymous namespace

const char* DataIssueName(DataIssue issue) noexcept {
    switch (issue) {
        case DataIssue::INVALID_COORDINATE:      return "InvalidCoordinate";
        case DataIssue::INVALID_DISTANCE:        return "InvalidDistance";
        case DataIssue::CORRUPTED_CACHE:         return "CorruptedCache";
        case DataIssue::GEOCODE_MISS:            return "GeocodeMiss";
        case DataIssue::NETWORK_GEOCODE_FAILURE: return "NetworkGeocodeFailure";
    }
    return "Unknown";
}

void AggregationDiagnostics::Record(DataIssue issue, std::size_t count) {
    switch (issue) {
        case DataIssue::INVALID_COORDINATE:
            invalid_coordinate_routes += count;
            break;
        case DataIssue::INVALID_DISTANCE:
            invalid_distance_routes += count;
            break;
        case DataIssue::CORRUPTED_CACHE:
            corrupted_cache_maps += count;
            break;
        case DataIssue::GEOCODE_MISS:
            geocode_misses += count;
            break;
        case DataIssue::NETWORK_GEOCODE_FAILURE:
            network_failures += count;
            break;
    }
}

std::size_t AggregationDiagnostics::Count(DataIssue issue) const {
    switch (issue) {
        case DataIssue::INVALID_COORDINATE:      return invalid_coordinate_routes;
        case DataIssue::INVALID_DISTANCE:        return invalid_distance_routes;
        case DataIssue::CORRUPTED_CACHE:         return corrupted_cache_maps;
        case DataIssue::GEOCODE_MISS:            return geocode_misses;
        case DataIssue::NETWORK_GEOCODE_FAILURE: return network_failures;
    }
    return 0;
}

double Snapshot::CountryKm(const std::string& label) const {
    return FindKm(countries, label);
}

double Snapshot::CityKm(const std::string& label) const {
    return FindKm(cities, label);
}

double Snapshot::CountrySum() const {
    double sum = 0.0;
    for (const auto& entry : countries) {
        sum += entry.km;
    }
    return sum;
}

} // namespace route_atlas
