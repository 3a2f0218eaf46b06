// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/routes/route_segmenter.h>
#include <route_atlas/math/geodetic_calculations.h>

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace route_atlas {

RouteSegmenter::RouteSegmenter(double max_gap_meters)
    : max_gap_meters_(max_gap_meters) {
    if (!(max_gap_meters_ > 0.0)) {
        throw std::invalid_argument("RouteSegmenter: max_gap_meters must be positive");
    }
}

std::vector<RouteSegmenter::Trace> RouteSegmenter::Segment(const Trace& points) const {
    std::vector<Trace> segments;
    if (points.empty()) {
        return segments;
    }

    Trace current;
    current.push_back(points.front());

    for (std::size_t i = 1; i < points.size(); ++i) {
        const double gap = GeodeticCalculator::HaversineDistanceMeters(points[i - 1], points[i]);
        if (gap <= max_gap_meters_) {
            current.push_back(points[i]);
            continue;
        }

        if (current.size() >= constants::routes::MIN_SEGMENT_POINTS) {
            segments.push_back(std::move(current));
        }
        current = Trace();
        current.push_back(points[i]);
    }

    if (current.size() >= constants::routes::MIN_SEGMENT_POINTS) {
        segments.push_back(std::move(current));
    }

    return segments;
}

std::vector<Route> RouteSegmenter::SplitRoute(const Route& route) const {
    std::vector<Trace> segments = Segment(route.GetCoordinates());

    std::vector<Route> result;
    if (segments.size() == 1 && segments.front().size() == route.GetPointCount()) {
        result.push_back(route);
        return result;
    }

    const double total_points = static_cast<double>(route.GetPointCount());
    result.reserve(segments.size());

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const double share = static_cast<double>(segments[i].size()) / total_points;
        result.emplace_back(route.GetId() + "#" + std::to_string(i + 1),
                            std::move(segments[i]),
                            route.GetTimestamp(),
                            route.GetCategory(),
                            route.GetDurationSeconds() * share);
    }

    if (result.empty()) {
        spdlog::debug("RouteSegmenter: route {} has no segment of {} or more points",
                      route.GetId(), constants::routes::MIN_SEGMENT_POINTS);
    } else if (result.size() > 1) {
        spdlog::trace("RouteSegmenter: route {} split into {} segments",
                      route.GetId(), result.size());
    }

    return result;
}

std::vector<Route> RouteSegmenter::SplitRoutes(const std::vector<Route>& routes) const {
    std::vector<Route> result;
    result.reserve(routes.size());

    for (const auto& route : routes) {
        for (auto& segment : SplitRoute(route)) {
            result.push_back(std::move(segment));
        }
    }

    return result;
}

} // namespace route_atlas
