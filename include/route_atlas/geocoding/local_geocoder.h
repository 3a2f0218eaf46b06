// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include "geo_database.h"
#include "geocode_provider.h"

#include <string>

namespace route_atlas {

/// How a point inside several overlapping country boxes is resolved
enum class CountryMatchPolicy {
    FIRST_MATCH,   ///< First box in table order (default)
    SMALLEST_AREA  ///< Smallest containing box, ties by table order
};

/// Nearest city of a country and its distance
struct CityDistance {
    const CityMarker* city;  ///< nullptr if the country lists no cities
    double distance_km;      ///< +infinity if city is nullptr
};

/// Fast, deterministic offline geocoder.
///
/// Resolves a coordinate to a country by bounding box and to a city label
/// by distance to the country's closest city marker:
///   <= 10 km  city name        0.95
///   <= 25 km  city name        0.80
///   <= 50 km  "Rural {country}" 0.70
///   farther   "Other {country}" 0.60
/// Points outside every box resolve to ("Unknown", "Unknown", 0.0).
class LocalGeocoder : public GeocodeProvider {
public:
    explicit LocalGeocoder(const GeoDatabase& database = GeoDatabase::Default(),
                           CountryMatchPolicy policy = CountryMatchPolicy::FIRST_MATCH);

    /// Pure function of (latitude, longitude) and the table
    [[nodiscard]] GeocodeResult Resolve(double latitude, double longitude) const;

    /// Always succeeds; a miss is reported as the "Unknown" result
    [[nodiscard]] GeocodeLookup Geocode(double latitude, double longitude) override;

    [[nodiscard]] std::string GetName() const override {
        return "local";
    }

    [[nodiscard]] bool IsThreadSafe() const override {
        return true;
    }

    /// Country whose box contains the point under the configured policy
    /// @return Pointer into the database, or nullptr
    [[nodiscard]] const CountryRegion* FindCountry(double latitude, double longitude) const;

    /// Closest city marker of a country
    [[nodiscard]] static CityDistance FindClosestCity(const coordinates::Geographic& point,
                                                      const CountryRegion& country);

    [[nodiscard]] CountryMatchPolicy GetPolicy() const noexcept {
        return policy_;
    }

private:
    const GeoDatabase& database_;
    CountryMatchPolicy policy_;
};

} // namespace route_atlas
