// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/route_atlas.h>
#include <route_atlas/geocoding/country_names.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace route_atlas {

namespace {

using json = nlohmann::json;

std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name) {
    const std::string lowered = ToLowerAscii(TrimWhitespace(name));
    if (lowered == "off") {
        return spdlog::level::off;
    }
    const auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off) {
        return std::nullopt;
    }
    return level;
}

std::optional<DistanceAttribution> ParseAttribution(const std::string& name) {
    const std::string lowered = ToLowerAscii(name);
    if (lowered == "equal") {
        return DistanceAttribution::EQUAL_SHARE;
    }
    if (lowered == "spacing" || lowered == "weighted") {
        return DistanceAttribution::SPACING_WEIGHTED;
    }
    return std::nullopt;
}

std::optional<CountryMatchPolicy> ParseCountryMatch(const std::string& name) {
    const std::string lowered = ToLowerAscii(name);
    if (lowered == "first") {
        return CountryMatchPolicy::FIRST_MATCH;
    }
    if (lowered == "smallest") {
        return CountryMatchPolicy::SMALLEST_AREA;
    }
    return std::nullopt;
}

std::optional<GeocoderKind> ParseGeocoderKind(const std::string& name) {
    const std::string lowered = ToLowerAscii(name);
    if (lowered == "local") {
        return GeocoderKind::LOCAL;
    }
    if (lowered == "network") {
        return GeocoderKind::NETWORK;
    }
    return std::nullopt;
}

/// Read an unsigned count; throws on a negative or non-integer value
std::size_t ReadCount(const json& value, const std::string& key) {
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<long long>() >= 0)) {
        throw std::invalid_argument("\"" + key + "\" must be a non-negative integer");
    }
    return value.get<std::size_t>();
}

template <typename T, typename Parser>
T ReadEnum(const json& value, const std::string& key, Parser parser) {
    const auto parsed = parser(value.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown value \"" + value.get<std::string>() +
                                    "\" for \"" + key + "\"");
    }
    return *parsed;
}

void Overlay(const json& document, Configuration& config) {
    if (document.contains("cache_directory")) {
        config.cache_directory = document["cache_directory"].get<std::string>();
    }
    if (document.contains("max_samples_per_route")) {
        config.max_samples_per_route = ReadCount(document["max_samples_per_route"], "max_samples_per_route");
    }
    if (document.contains("publish_interval_routes")) {
        config.publish_interval_routes = ReadCount(document["publish_interval_routes"], "publish_interval_routes");
    }
    if (document.contains("max_gap_meters")) {
        config.max_gap_meters = document["max_gap_meters"].get<double>();
    }
    if (document.contains("segment_routes")) {
        config.segment_routes = document["segment_routes"].get<bool>();
    }
    if (document.contains("attribution")) {
        config.attribution = ReadEnum<DistanceAttribution>(document["attribution"], "attribution",
                                                           ParseAttribution);
    }
    if (document.contains("country_match")) {
        config.country_match = ReadEnum<CountryMatchPolicy>(document["country_match"], "country_match",
                                                            ParseCountryMatch);
    }
    if (document.contains("geocoder")) {
        config.geocoder = ReadEnum<GeocoderKind>(document["geocoder"], "geocoder", ParseGeocoderKind);
    }
    if (document.contains("log_level")) {
        config.log_level = document["log_level"].get<std::string>();
    }

    if (document.contains("network")) {
        const json& network = document["network"];
        if (!network.is_object()) {
            throw std::invalid_argument("\"network\" must be an object");
        }
        if (network.contains("url_template")) {
            config.network.url_template = network["url_template"].get<std::string>();
        }
        if (network.contains("user_agent")) {
            config.network.user_agent = network["user_agent"].get<std::string>();
        }
        if (network.contains("timeout_seconds")) {
            config.network.timeout_seconds = network["timeout_seconds"].get<long>();
        }
        if (network.contains("max_concurrent_lookups")) {
            config.network_max_concurrent_lookups =
                ReadCount(network["max_concurrent_lookups"], "max_concurrent_lookups");
        }
    }
}

} // anonymous namespace

bool ParseConfiguration(const std::string& document, Configuration& config, std::string& error_message) {
    const json root = json::parse(document, nullptr, false);
    if (root.is_discarded()) {
        error_message = "configuration is not valid JSON";
        return false;
    }
    if (!root.is_object()) {
        error_message = "configuration must be a JSON object";
        return false;
    }

    Configuration updated = config;
    try {
        Overlay(root, updated);
    } catch (const json::exception& e) {
        error_message = std::string("configuration has a value of the wrong type: ") + e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        error_message = std::string("configuration: ") + e.what();
        return false;
    }

    config = std::move(updated);
    return true;
}

bool LoadConfiguration(const std::string& path, Configuration& config, std::string& error_message) {
    std::ifstream file(path);
    if (!file) {
        error_message = "cannot open configuration file " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!ParseConfiguration(buffer.str(), config, error_message)) {
        error_message = path + ": " + error_message;
        return false;
    }

    spdlog::debug("Configuration: loaded {}", path);
    return true;
}

bool ValidateConfiguration(const Configuration& config, std::string& error_message) {
    if (config.max_samples_per_route == 0) {
        error_message = "max_samples_per_route must be at least 1";
        return false;
    }
    if (config.publish_interval_routes == 0) {
        error_message = "publish_interval_routes must be at least 1";
        return false;
    }
    if (!(config.max_gap_meters > 0.0)) {
        error_message = "max_gap_meters must be positive";
        return false;
    }
    if (config.cache_directory.empty()) {
        error_message = "cache_directory must not be empty";
        return false;
    }
    if (config.network.timeout_seconds <= 0) {
        error_message = "network.timeout_seconds must be positive";
        return false;
    }
    if (config.network_max_concurrent_lookups == 0) {
        error_message = "network.max_concurrent_lookups must be at least 1";
        return false;
    }
    if (!ParseLogLevel(config.log_level)) {
        error_message = "unknown log_level \"" + config.log_level + "\"";
        return false;
    }
    return true;
}

StatsAggregatorConfig MakeAggregatorConfig(const Configuration& config) {
    StatsAggregatorConfig aggregator;
    aggregator.max_samples_per_route = config.max_samples_per_route;
    aggregator.publish_interval_routes = config.publish_interval_routes;
    aggregator.attribution = config.attribution;
    aggregator.max_concurrent_lookups = config.geocoder == GeocoderKind::NETWORK
        ? config.network_max_concurrent_lookups
        : 1;
    return aggregator;
}

RouteLoaderConfig MakeLoaderConfig(const Configuration& config) {
    RouteLoaderConfig loader;
    loader.segment_routes = config.segment_routes;
    loader.max_gap_meters = config.max_gap_meters;
    return loader;
}

bool ApplyLogLevel(const Configuration& config) {
    const auto level = ParseLogLevel(config.log_level);
    if (!level) {
        spdlog::warn("Configuration: unknown log level '{}'", config.log_level);
        return false;
    }
    spdlog::set_level(*level);
    return true;
}

} // namespace route_atlas
