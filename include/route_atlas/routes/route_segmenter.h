// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include "route.h"

#include <route_atlas/constants.h>

#include <vector>

namespace route_atlas {

/// Splits raw GPS traces into movement segments.
///
/// A segment grows while consecutive points are at most max_gap_meters
/// apart; a larger gap (pause, signal loss, teleport) closes it and starts
/// a new one at the far point. Segments with fewer than two points carry no
/// distance and are dropped.
class RouteSegmenter {
public:
    using Trace = std::vector<coordinates::Geographic>;

    explicit RouteSegmenter(double max_gap_meters = constants::routes::DEFAULT_MAX_GAP_METERS);

    /// Split a trace; segments keep the original point order
    [[nodiscard]] std::vector<Trace> Segment(const Trace& points) const;

    /// Split a route into one route per kept segment.
    /// Segment routes keep timestamp and category, get ids "{id}#{n}"
    /// (n from 1) and a share of the duration proportional to their number
    /// of points. A route that needs no split is returned unchanged.
    [[nodiscard]] std::vector<Route> SplitRoute(const Route& route) const;

    /// SplitRoute over a whole route list, in input order
    [[nodiscard]] std::vector<Route> SplitRoutes(const std::vector<Route>& routes) const;

    [[nodiscard]] double GetMaxGapMeters() const noexcept {
        return max_gap_meters_;
    }

private:
    double max_gap_meters_;
};

} // namespace route_atlas
