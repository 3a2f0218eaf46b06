// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/routes/route.h>
#include <route_atlas/geocoding/country_names.h>
#include <route_atlas/math/geodetic_calculations.h>

#include <cstdint>
#include <utility>

namespace route_atlas {

const char* RouteCategoryName(RouteCategory category) noexcept {
    switch (category) {
        case RouteCategory::RUNNING:
            return "running";
        case RouteCategory::WALKING:
            return "walking";
        case RouteCategory::CYCLING:
            return "cycling";
        case RouteCategory::OTHER:
            return "other";
    }
    return "other";
}

std::optional<RouteCategory> ParseRouteCategory(const std::string& name) {
    const std::string lowered = ToLowerAscii(TrimWhitespace(name));
    if (lowered == "running" || lowered == "run") {
        return RouteCategory::RUNNING;
    }
    if (lowered == "walking" || lowered == "walk") {
        return RouteCategory::WALKING;
    }
    if (lowered == "cycling" || lowered == "ride") {
        return RouteCategory::CYCLING;
    }
    if (lowered == "other") {
        return RouteCategory::OTHER;
    }
    return std::nullopt;
}

Route::Route()
    : category_(RouteCategory::OTHER),
      duration_seconds_(0.0),
      distance_km_(0.0) {}

Route::Route(std::string id,
             std::vector<coordinates::Geographic> points,
             Clock::time_point timestamp,
             RouteCategory category,
             double duration_seconds)
    : id_(std::move(id)),
      points_(std::move(points)),
      timestamp_(timestamp),
      category_(category),
      duration_seconds_(duration_seconds),
      distance_km_(GeodeticCalculator::RouteDistanceKm(points_)) {}

bool Route::HasValidCoordinates() const noexcept {
    return coordinates::AllValid(points_);
}

bool Route::IsWithinDays(int days, Clock::time_point now) const {
    using std::chrono::seconds;

    const seconds now_seconds = std::chrono::duration_cast<seconds>(now.time_since_epoch());
    const std::int64_t cutoff_seconds =
        now_seconds.count() - static_cast<std::int64_t>(days) * 86400;

    // A cutoff before the clock's earliest time point keeps every route
    const std::int64_t min_seconds =
        std::chrono::duration_cast<seconds>(Clock::duration::min()).count();
    if (cutoff_seconds <= min_seconds) {
        return true;
    }
    const std::int64_t max_seconds =
        std::chrono::duration_cast<seconds>(Clock::duration::max()).count();
    if (cutoff_seconds >= max_seconds) {
        return false;
    }

    const Clock::time_point cutoff =
        Clock::time_point(seconds(cutoff_seconds)) + (now.time_since_epoch() - now_seconds);
    return timestamp_ >= cutoff;
}

} // namespace route_atlas
