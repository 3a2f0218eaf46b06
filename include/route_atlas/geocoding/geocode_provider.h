// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <utility>

namespace route_atlas {

/// Resolved place of a coordinate
struct GeocodeResult {
    std::string country;  ///< Country name (normalized by the provider)
    std::string city;     ///< City or regional label
    double confidence;    ///< Closeness to a known city marker, [0, 1]

    GeocodeResult() : confidence(0.0) {}

    GeocodeResult(std::string country_name, std::string city_label, double conf)
        : country(std::move(country_name)),
          city(std::move(city_label)),
          confidence(conf) {}
};

/// Failure classes of a lookup
enum class GeocodeError {
    NONE,       ///< Lookup succeeded
    TIMEOUT,    ///< Remote service did not answer in time
    NO_RESULT,  ///< Service answered without a usable place
    TRANSPORT   ///< Connection, HTTP or decoding failure
};

/// Outcome of a single lookup
struct GeocodeLookup {
    bool success;               ///< True if result is usable
    GeocodeResult result;       ///< Place (valid when success)
    GeocodeError error;         ///< Failure class (NONE when success)
    std::string error_message;  ///< Error description if failed

    GeocodeLookup() : success(false), error(GeocodeError::NONE) {}

    static GeocodeLookup Success(GeocodeResult place) {
        GeocodeLookup lookup;
        lookup.success = true;
        lookup.result = std::move(place);
        return lookup;
    }

    static GeocodeLookup Failure(GeocodeError error, std::string message) {
        GeocodeLookup lookup;
        lookup.error = error;
        lookup.error_message = std::move(message);
        return lookup;
    }
};

/// Printable name of an error class
[[nodiscard]] const char* GeocodeErrorName(GeocodeError error) noexcept;

/// Coordinate -> place resolver.
/// The offline LocalGeocoder is the default implementation; the network
/// reverse geocoder is a slower, swappable alternative behind the same
/// contract.
class GeocodeProvider {
public:
    virtual ~GeocodeProvider() = default;

    /// Resolve a coordinate
    /// @param latitude Latitude in degrees [-90, 90]
    /// @param longitude Longitude in degrees [-180, 180]
    /// @return Lookup result; failures are reported here rather than thrown.
    /// StatsAggregator treats a thrown std::exception as a TRANSPORT failure.
    [[nodiscard]] virtual GeocodeLookup Geocode(double latitude, double longitude) = 0;

    /// Short provider name for logs
    [[nodiscard]] virtual std::string GetName() const = 0;

    /// True if Geocode may be called from several threads at once
    [[nodiscard]] virtual bool IsThreadSafe() const = 0;
};

} // namespace route_atlas
