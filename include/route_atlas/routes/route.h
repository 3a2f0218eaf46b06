// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <route_atlas/coordinates/coordinate_spaces.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace route_atlas {

/// Activity type of a recorded route
enum class RouteCategory {
    RUNNING,
    WALKING,
    CYCLING,
    OTHER
};

/// Lower-case name ("running", "walking", ...)
[[nodiscard]] const char* RouteCategoryName(RouteCategory category) noexcept;

/// Parse a category name (case-insensitive)
/// @return Category, or nullopt for unrecognized names
[[nodiscard]] std::optional<RouteCategory> ParseRouteCategory(const std::string& name);

/// One recorded GPS trace.
///
/// The point sequence is fixed at construction; the great-circle length is
/// computed once there and reused by every caller.
class Route {
public:
    using Clock = std::chrono::system_clock;

    Route();

    /// @param id Route identity
    /// @param points Ordered trace points
    /// @param timestamp Start time of the activity
    /// @param category Activity type
    /// @param duration_seconds Activity duration
    Route(std::string id,
          std::vector<coordinates::Geographic> points,
          Clock::time_point timestamp = Clock::time_point(),
          RouteCategory category = RouteCategory::OTHER,
          double duration_seconds = 0.0);

    [[nodiscard]] const std::string& GetId() const noexcept {
        return id_;
    }

    [[nodiscard]] const std::vector<coordinates::Geographic>& GetCoordinates() const noexcept {
        return points_;
    }

    [[nodiscard]] Clock::time_point GetTimestamp() const noexcept {
        return timestamp_;
    }

    [[nodiscard]] RouteCategory GetCategory() const noexcept {
        return category_;
    }

    [[nodiscard]] double GetDurationSeconds() const noexcept {
        return duration_seconds_;
    }

    /// Sum of consecutive great-circle distances in kilometers (0 for fewer
    /// than two points). Not validated; see GeodeticCalculator::IsValidDistance.
    [[nodiscard]] double DistanceKm() const noexcept {
        return distance_km_;
    }

    [[nodiscard]] std::size_t GetPointCount() const noexcept {
        return points_.size();
    }

    /// True if every point is a valid coordinate
    [[nodiscard]] bool HasValidCoordinates() const noexcept;

    /// True if the route started within the last `days` days before now
    [[nodiscard]] bool IsWithinDays(int days, Clock::time_point now = Clock::now()) const;

private:
    std::string id_;
    std::vector<coordinates::Geographic> points_;
    Clock::time_point timestamp_;
    RouteCategory category_;
    double duration_seconds_;
    double distance_km_;
};

} // namespace route_atlas
