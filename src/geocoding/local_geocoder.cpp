// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/geocoding/local_geocoder.h>
#include <route_atlas/geocoding/country_names.h>
#include <route_atlas/constants.h>
#include <route_atlas/math/geodetic_calculations.h>

#include <limits>
#include <utility>

namespace route_atlas {

namespace geo = constants::geocoder;

LocalGeocoder::LocalGeocoder(const GeoDatabase& database, CountryMatchPolicy policy)
    : database_(database), policy_(policy) {}

const CountryRegion* LocalGeocoder::FindCountry(double latitude, double longitude) const {
    const CountryRegion* match = nullptr;

    for (const auto& country : database_.GetCountries()) {
        if (!country.bounds.Contains(latitude, longitude)) {
            continue;
        }
        if (policy_ == CountryMatchPolicy::FIRST_MATCH) {
            return &country;
        }
        // Strict comparison keeps the earlier entry on equal areas
        if (match == nullptr || country.bounds.AreaDegrees() < match->bounds.AreaDegrees()) {
            match = &country;
        }
    }

    return match;
}

CityDistance LocalGeocoder::FindClosestCity(const coordinates::Geographic& point,
                                            const CountryRegion& country) {
    CityDistance closest{nullptr, std::numeric_limits<double>::infinity()};

    for (const auto& city : country.cities) {
        const double distance = GeodeticCalculator::HaversineDistanceKm(point, city.location);
        if (closest.city == nullptr || distance < closest.distance_km) {
            closest.city = &city;
            closest.distance_km = distance;
        }
    }

    return closest;
}

GeocodeResult LocalGeocoder::Resolve(double latitude, double longitude) const {
    const CountryRegion* country = FindCountry(latitude, longitude);
    if (country == nullptr) {
        return GeocodeResult(geo::UNKNOWN_LABEL, geo::UNKNOWN_LABEL, geo::CONFIDENCE_NONE);
    }

    const CityDistance closest =
        FindClosestCity(coordinates::Geographic(latitude, longitude), *country);

    std::string city;
    double confidence = geo::CONFIDENCE_COUNTRY;

    if (closest.city != nullptr && closest.distance_km <= geo::CITY_NEAR_KM) {
        city = closest.city->name;
        confidence = geo::CONFIDENCE_NEAR;
    } else if (closest.city != nullptr && closest.distance_km <= geo::CITY_CLOSE_KM) {
        city = closest.city->name;
        confidence = geo::CONFIDENCE_CLOSE;
    } else if (closest.city != nullptr && closest.distance_km <= geo::CITY_REGION_KM) {
        city = geo::RURAL_PREFIX + country->name;
        confidence = geo::CONFIDENCE_REGION;
    } else {
        city = geo::OTHER_PREFIX + country->name;
    }

    return GeocodeResult(NormalizeCountryName(country->name), std::move(city), confidence);
}

GeocodeLookup LocalGeocoder::Geocode(double latitude, double longitude) {
    return GeocodeLookup::Success(Resolve(latitude, longitude));
}

} // namespace route_atlas
