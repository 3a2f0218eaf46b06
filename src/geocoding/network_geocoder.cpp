// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/geocoding/network_geocoder.h>
#include <route_atlas/geocoding/country_names.h>
#include <route_atlas/constants.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>

namespace route_atlas {

namespace {

/// libcurl write callback
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    const size_t total_size = size * nmemb;
    userp->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

void ReplacePlaceholder(std::string& text, const std::string& placeholder,
                        const std::string& value) {
    const size_t pos = text.find(placeholder);
    if (pos != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
    }
}

/// First non-empty string among the given address fields
std::string FirstAddressField(const nlohmann::json& address) {
    static const std::array<const char*, 5> kLocalityFields = {
        "city", "town", "village", "municipality", "county"};

    for (const char* field : kLocalityFields) {
        const auto it = address.find(field);
        if (it != address.end() && it->is_string()) {
            std::string value = it->get<std::string>();
            if (!value.empty()) {
                return value;
            }
        }
    }
    return std::string();
}

} // anonymous namespace

NetworkGeocoderConfig::NetworkGeocoderConfig()
    : url_template(constants::network::DEFAULT_URL_TEMPLATE),
      timeout_seconds(constants::network::DEFAULT_TIMEOUT_SECONDS),
      user_agent(constants::network::DEFAULT_USER_AGENT) {}

NetworkGeocoder::NetworkGeocoder(NetworkGeocoderConfig config)
    : config_(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    spdlog::info("NetworkGeocoder: using endpoint template {}", config_.url_template);
}

NetworkGeocoder::~NetworkGeocoder() {
    curl_global_cleanup();
}

std::string NetworkGeocoder::BuildURL(double latitude, double longitude) const {
    std::string url = config_.url_template;
    ReplacePlaceholder(url, "{lat}", fmt::format("{:.6f}", latitude));
    ReplacePlaceholder(url, "{lon}", fmt::format("{:.6f}", longitude));
    return url;
}

GeocodeLookup NetworkGeocoder::Geocode(double latitude, double longitude) {
    const std::string url = BuildURL(latitude, longitude);

    CURL* curl = curl_easy_init();
    if (!curl) {
        auto lookup = GeocodeLookup::Failure(GeocodeError::TRANSPORT, "curl_easy_init failed");
        Record(lookup);
        return lookup;
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    curl_easy_cleanup(curl);

    GeocodeLookup lookup;
    if (res == CURLE_OPERATION_TIMEDOUT) {
        lookup = GeocodeLookup::Failure(GeocodeError::TIMEOUT,
                                        fmt::format("timed out after {}s", config_.timeout_seconds));
    } else if (res != CURLE_OK) {
        lookup = GeocodeLookup::Failure(GeocodeError::TRANSPORT, curl_easy_strerror(res));
    } else if (http_status != 200) {
        lookup = GeocodeLookup::Failure(GeocodeError::TRANSPORT,
                                        fmt::format("HTTP status {}", http_status));
    } else {
        lookup = ParseResponse(body);
    }

    if (!lookup.success) {
        spdlog::debug("NetworkGeocoder: lookup ({:.5f}, {:.5f}) failed ({}): {}",
                      latitude, longitude, GeocodeErrorName(lookup.error),
                      lookup.error_message);
    }

    Record(lookup);
    return lookup;
}

GeocodeLookup NetworkGeocoder::ParseResponse(const std::string& body) {
    const nlohmann::json reply = nlohmann::json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return GeocodeLookup::Failure(GeocodeError::TRANSPORT, "undecodable response body");
    }

    if (reply.contains("error")) {
        return GeocodeLookup::Failure(GeocodeError::NO_RESULT, "service reported no place");
    }

    const auto address = reply.find("address");
    if (address == reply.end() || !address->is_object()) {
        return GeocodeLookup::Failure(GeocodeError::NO_RESULT, "response has no address");
    }

    const auto country_it = address->find("country");
    if (country_it == address->end() || !country_it->is_string() ||
        country_it->get<std::string>().empty()) {
        return GeocodeLookup::Failure(GeocodeError::NO_RESULT, "response has no country");
    }

    const std::string country = NormalizeCountryName(country_it->get<std::string>());
    const std::string locality = FirstAddressField(*address);

    if (locality.empty()) {
        return GeocodeLookup::Success(GeocodeResult(
            country, constants::geocoder::OTHER_PREFIX + country,
            constants::geocoder::CONFIDENCE_COUNTRY));
    }

    return GeocodeLookup::Success(
        GeocodeResult(country, locality, constants::network::CONFIDENCE_LOCALITY));
}

NetworkGeocoderStats NetworkGeocoder::GetStatistics() const {
    NetworkGeocoderStats stats;
    stats.requests = requests_.load();
    stats.succeeded = succeeded_.load();
    stats.timeouts = timeouts_.load();
    stats.no_results = no_results_.load();
    stats.transport_errors = transport_errors_.load();
    return stats;
}

void NetworkGeocoder::Record(const GeocodeLookup& lookup) {
    ++requests_;
    if (lookup.success) {
        ++succeeded_;
        return;
    }

    switch (lookup.error) {
        case GeocodeError::TIMEOUT:
            ++timeouts_;
            break;
        case GeocodeError::NO_RESULT:
            ++no_results_;
            break;
        case GeocodeError::TRANSPORT:
        case GeocodeError::NONE:
            ++transport_errors_;
            break;
    }
}

} // namespace route_atlas
