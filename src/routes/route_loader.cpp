// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/routes/route_loader.h>
#include <route_atlas/routes/route_segmenter.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace route_atlas {

namespace {

using json = nlohmann::json;

/// Days since 1970-01-01 of a proleptic Gregorian date
std::int64_t DaysFromCivil(std::int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

/// Seconds since the epoch as a clock time point; nullopt if the clock cannot represent it
std::optional<Route::Clock::time_point> ToTimePoint(double seconds) {
    const double limit = static_cast<double>(
        std::chrono::duration_cast<std::chrono::seconds>(Route::Clock::duration::max()).count());
    if (!std::isfinite(seconds) || seconds >= limit || seconds <= -limit) {
        return std::nullopt;
    }
    return Route::Clock::time_point(
        std::chrono::duration_cast<Route::Clock::duration>(
            std::chrono::duration<double>(seconds)));
}

std::optional<coordinates::Geographic> ParseCoordinate(const json& value) {
    if (!value.is_array() || value.size() != 2 ||
        !value[0].is_number() || !value[1].is_number()) {
        return std::nullopt;
    }
    return coordinates::Geographic(value[0].get<double>(), value[1].get<double>());
}

std::optional<Route::Clock::time_point> ParseTimestampValue(const json& value) {
    if (value.is_number()) {
        return ToTimePoint(value.get<double>());
    }
    if (value.is_string()) {
        return ParseTimestamp(value.get<std::string>());
    }
    return std::nullopt;
}

/// Decode one record; nullopt (with reason) if malformed
std::optional<Route> ParseRecord(const json& record, std::string& reason) {
    if (!record.is_object()) {
        reason = "record is not an object";
        return std::nullopt;
    }

    const auto id = record.find("id");
    if (id == record.end() || !(id->is_string() || id->is_number_integer())) {
        reason = "missing id";
        return std::nullopt;
    }
    const std::string route_id = id->is_string() ? id->get<std::string>() : id->dump();

    const auto coords = record.find("coordinates");
    if (coords == record.end() || !coords->is_array()) {
        reason = "missing coordinates";
        return std::nullopt;
    }

    std::vector<coordinates::Geographic> points;
    points.reserve(coords->size());
    for (const auto& value : *coords) {
        const auto point = ParseCoordinate(value);
        if (!point) {
            reason = "malformed coordinate";
            return std::nullopt;
        }
        points.push_back(*point);
    }

    Route::Clock::time_point timestamp;
    const auto ts = record.find("timestamp");
    if (ts != record.end() && !ts->is_null()) {
        const auto parsed = ParseTimestampValue(*ts);
        if (!parsed) {
            reason = "malformed timestamp";
            return std::nullopt;
        }
        timestamp = *parsed;
    }

    RouteCategory category = RouteCategory::OTHER;
    const auto cat = record.find("category");
    if (cat != record.end() && !cat->is_null()) {
        const auto parsed = cat->is_string() ? ParseRouteCategory(cat->get<std::string>())
                                             : std::nullopt;
        if (!parsed) {
            reason = "unknown category";
            return std::nullopt;
        }
        category = *parsed;
    }

    double duration = 0.0;
    const auto dur = record.find("duration_seconds");
    if (dur != record.end() && !dur->is_null()) {
        if (!dur->is_number() || dur->get<double>() < 0.0) {
            reason = "malformed duration";
            return std::nullopt;
        }
        duration = dur->get<double>();
    }

    return Route(route_id, std::move(points), timestamp, category, duration);
}

} // anonymous namespace

RouteLoader::RouteLoader(RouteLoaderConfig config) : config_(config) {}

RouteLoadResult RouteLoader::LoadFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        RouteLoadResult result;
        result.error_message = "Cannot open route file: " + path;
        spdlog::error("RouteLoader: {}", result.error_message);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        RouteLoadResult result;
        result.error_message = "Read error on route file: " + path;
        spdlog::error("RouteLoader: {}", result.error_message);
        return result;
    }

    spdlog::debug("RouteLoader: reading {}", path);
    return LoadString(buffer.str());
}

RouteLoadResult RouteLoader::LoadString(const std::string& document) const {
    RouteLoadResult result;

    const json root = json::parse(document, nullptr, false);
    if (root.is_discarded()) {
        result.error_message = "Route document is not valid JSON";
        spdlog::error("RouteLoader: {}", result.error_message);
        return result;
    }

    const json* records = nullptr;
    if (root.is_array()) {
        records = &root;
    } else if (root.is_object() && root.contains("routes") && root["routes"].is_array()) {
        records = &root["routes"];
    }
    if (records == nullptr) {
        result.error_message = "Route document has no \"routes\" array";
        spdlog::error("RouteLoader: {}", result.error_message);
        return result;
    }

    std::vector<Route> routes;
    routes.reserve(records->size());
    result.record_count = records->size();

    for (std::size_t i = 0; i < records->size(); ++i) {
        std::string reason;
        auto route = ParseRecord((*records)[i], reason);
        if (!route) {
            ++result.skipped_records;
            spdlog::warn("RouteLoader: skipping record {}: {}", i, reason);
            continue;
        }
        routes.push_back(std::move(*route));
    }

    if (config_.segment_routes) {
        const RouteSegmenter segmenter(config_.max_gap_meters);
        for (const auto& route : routes) {
            auto segments = segmenter.SplitRoute(route);
            if (segments.empty()) {
                ++result.dropped_routes;
                continue;
            }
            for (auto& segment : segments) {
                result.routes.push_back(std::move(segment));
            }
        }
    } else {
        result.routes = std::move(routes);
    }

    result.success = true;
    spdlog::info("RouteLoader: loaded {} routes from {} records ({} skipped, {} without usable segments)",
                 result.routes.size(), result.record_count,
                 result.skipped_records, result.dropped_routes);
    return result;
}

std::optional<Route::Clock::time_point> ParseTimestamp(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2u-%2u%*1[Tt ]%2u:%2u:%2u%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    double fraction = 0.0;
    if (pos < text.size() && text[pos] == '.') {
        const std::size_t start = pos;
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos == start + 1) {
            return std::nullopt;
        }
        fraction = std::stod("0" + text.substr(start, pos - start));
    }

    std::int64_t offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        unsigned offset_hours = 0;
        unsigned offset_minutes = 0;
        int offset_consumed = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2u:%2u%n",
                        &offset_hours, &offset_minutes, &offset_consumed) != 2 ||
            offset_hours > 23 || offset_minutes > 59) {
            return std::nullopt;
        }
        offset_seconds = sign * static_cast<std::int64_t>(offset_hours * 3600 + offset_minutes * 60);
        pos += 1 + static_cast<std::size_t>(offset_consumed);
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t days = DaysFromCivil(year, month, day);
    const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    return ToTimePoint(static_cast<double>(seconds) + fraction);
}

std::vector<Route> FilterRoutes(const std::vector<Route>& routes,
                                const RouteFilter& filter,
                                Route::Clock::time_point now) {
    std::vector<Route> kept;
    kept.reserve(routes.size());

    for (const auto& route : routes) {
        if (!filter.categories.empty() &&
            std::find(filter.categories.begin(), filter.categories.end(),
                      route.GetCategory()) == filter.categories.end()) {
            continue;
        }
        if (filter.max_age_days > 0 && !route.IsWithinDays(filter.max_age_days, now)) {
            continue;
        }
        kept.push_back(route);
    }

    return kept;
}

} // namespace route_atlas
