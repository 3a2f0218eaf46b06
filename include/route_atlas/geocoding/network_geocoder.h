// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include "geocode_provider.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace route_atlas {

/// Configuration for the network reverse geocoder
struct NetworkGeocoderConfig {
    /// URL template of a Nominatim-compatible reverse endpoint
    /// Placeholders: {lat}, {lon}
    std::string url_template;

    /// HTTP timeout in seconds
    long timeout_seconds;

    /// User agent string for HTTP requests
    std::string user_agent;

    NetworkGeocoderConfig();
};

/// Statistics for the network geocoder
struct NetworkGeocoderStats {
    uint64_t requests;          ///< Lookups attempted
    uint64_t succeeded;         ///< Lookups that produced a place
    uint64_t timeouts;          ///< TIMEOUT failures
    uint64_t no_results;        ///< NO_RESULT failures
    uint64_t transport_errors;  ///< TRANSPORT failures

    NetworkGeocoderStats()
        : requests(0), succeeded(0), timeouts(0), no_results(0), transport_errors(0) {}
};

/// Reverse geocoder backed by an HTTP service (libcurl).
/// Slower alternative to LocalGeocoder behind the same GeocodeProvider
/// contract; every failure is reported, never thrown.
class NetworkGeocoder : public GeocodeProvider {
public:
    explicit NetworkGeocoder(NetworkGeocoderConfig config = NetworkGeocoderConfig());
    ~NetworkGeocoder() override;

    NetworkGeocoder(const NetworkGeocoder&) = delete;
    NetworkGeocoder& operator=(const NetworkGeocoder&) = delete;

    [[nodiscard]] GeocodeLookup Geocode(double latitude, double longitude) override;

    [[nodiscard]] std::string GetName() const override {
        return "network";
    }

    [[nodiscard]] bool IsThreadSafe() const override {
        return true;
    }

    [[nodiscard]] NetworkGeocoderStats GetStatistics() const;

    [[nodiscard]] const NetworkGeocoderConfig& GetConfiguration() const noexcept {
        return config_;
    }

    /// Expand the URL template for a coordinate
    [[nodiscard]] std::string BuildURL(double latitude, double longitude) const;

    /// Decode a reverse-geocoding JSON reply.
    /// Reads address.country and the first of city / town / village /
    /// municipality / county; a reply carrying "error" or no country is
    /// NO_RESULT, an undecodable body is TRANSPORT.
    [[nodiscard]] static GeocodeLookup ParseResponse(const std::string& body);

private:
    void Record(const GeocodeLookup& lookup);

    NetworkGeocoderConfig config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> succeeded_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> no_results_{0};
    std::atomic<uint64_t> transport_errors_{0};
};

} // namespace route_atlas
