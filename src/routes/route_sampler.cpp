// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/routes/route_sampler.h>
#include <route_atlas/math/geodetic_calculations.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace route_atlas {

namespace {

bool DiffersFrom(const coordinates::Geographic& a, const coordinates::Geographic& b) {
    constexpr double kTolerance = constants::routes::SAMPLE_DEDUP_TOLERANCE_DEG;
    return std::abs(a.latitude - b.latitude) > kTolerance ||
           std::abs(a.longitude - b.longitude) > kTolerance;
}

} // anonymous namespace

RouteSampler::RouteSampler(std::size_t max_samples, DistanceAttribution attribution)
    : max_samples_(max_samples), attribution_(attribution) {
    if (max_samples_ == 0) {
        throw std::invalid_argument("RouteSampler: max_samples must be at least 1");
    }
}

std::vector<std::size_t> RouteSampler::SelectIndices(
    const std::vector<coordinates::Geographic>& points) const {

    std::vector<std::size_t> indices;
    const std::size_t count = points.size();

    if (count <= max_samples_) {
        indices.resize(count);
        std::iota(indices.begin(), indices.end(), std::size_t{0});
        return indices;
    }

    const std::size_t stride = std::max<std::size_t>(1, count / max_samples_);
    for (std::size_t i = 0; i < count; i += stride) {
        indices.push_back(i);
    }

    const std::size_t last = count - 1;
    if (indices.back() != last && DiffersFrom(points[last], points[indices.back()])) {
        indices.push_back(last);
    }

    return indices;
}

RouteSample RouteSampler::Sample(const std::vector<coordinates::Geographic>& points,
                                 double total_distance_km) const {
    RouteSample sample;
    const std::vector<std::size_t> indices = SelectIndices(points);
    if (indices.empty()) {
        return sample;
    }

    sample.points.reserve(indices.size());
    for (const std::size_t index : indices) {
        sample.points.push_back(points[index]);
    }

    if (attribution_ == DistanceAttribution::SPACING_WEIGHTED) {
        sample.shares_km = WeightedShares(points, indices, total_distance_km);
    }

    if (sample.shares_km.empty()) {
        const double share = total_distance_km / static_cast<double>(indices.size());
        sample.shares_km.assign(indices.size(), share);
    }

    return sample;
}

std::vector<double> RouteSampler::WeightedShares(
    const std::vector<coordinates::Geographic>& points,
    const std::vector<std::size_t>& indices,
    double total_distance_km) const {

    const std::vector<double> cumulative = GeodeticCalculator::CumulativeDistanceKm(points);
    const std::size_t sample_count = indices.size();

    // Each sample owns half the trace to its neighbours; the first and last
    // samples also own the trace before / after them.
    std::vector<double> weights(sample_count, 0.0);
    for (std::size_t j = 0; j < sample_count; ++j) {
        const double here = cumulative[indices[j]];
        const double left = (j == 0)
            ? here - cumulative.front()
            : (here - cumulative[indices[j - 1]]) / 2.0;
        const double right = (j + 1 == sample_count)
            ? cumulative.back() - here
            : (cumulative[indices[j + 1]] - here) / 2.0;
        weights[j] = left + right;
    }

    const double weight_sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!(weight_sum > 0.0) || !std::isfinite(weight_sum)) {
        return {};
    }

    for (double& weight : weights) {
        weight = total_distance_km * weight / weight_sum;
    }
    return weights;
}

} // namespace route_atlas
