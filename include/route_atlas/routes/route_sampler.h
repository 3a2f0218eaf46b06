// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <route_atlas/coordinates/coordinate_spaces.h>
#include <route_atlas/constants.h>

#include <cstddef>
#include <vector>

namespace route_atlas {

/// How a route's distance is spread over its sample points
enum class DistanceAttribution {
    EQUAL_SHARE,      ///< total / sample_count for every sample (default)
    SPACING_WEIGHTED  ///< proportional to the trace length around each sample
};

/// Sample points of a route with the distance attributed to each of them
struct RouteSample {
    std::vector<coordinates::Geographic> points;  ///< Representative points, trace order
    std::vector<double> shares_km;                ///< Distance per point, same size

    [[nodiscard]] std::size_t Size() const noexcept {
        return points.size();
    }
};

/// Reduces a trace to a bounded set of representative points.
///
/// Traces with at most max_samples points are used as-is. Longer traces keep
/// every stride-th point, stride = max(1, n / max_samples), and the last
/// point is appended unless it lies within 0.0001° of the last sample on
/// both axes.
class RouteSampler {
public:
    explicit RouteSampler(std::size_t max_samples = constants::routes::DEFAULT_MAX_SAMPLES,
                          DistanceAttribution attribution = DistanceAttribution::EQUAL_SHARE);

    /// Indices into points of the kept samples, ascending
    [[nodiscard]] std::vector<std::size_t> SelectIndices(
        const std::vector<coordinates::Geographic>& points) const;

    /// Sample a trace and spread total_distance_km over the samples
    [[nodiscard]] RouteSample Sample(const std::vector<coordinates::Geographic>& points,
                                     double total_distance_km) const;

    [[nodiscard]] std::size_t GetMaxSamples() const noexcept {
        return max_samples_;
    }

    [[nodiscard]] DistanceAttribution GetAttribution() const noexcept {
        return attribution_;
    }

private:
    std::vector<double> WeightedShares(const std::vector<coordinates::Geographic>& points,
                                       const std::vector<std::size_t>& indices,
                                       double total_distance_km) const;

    std::size_t max_samples_;
    DistanceAttribution attribution_;
};

} // namespace route_atlas
