// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/stats/tally.h>

#include <algorithm>
#include <cmath>

namespace route_atlas {

bool Tally::Add(const std::string& label, double km) {
    if (!std::isfinite(km) || km < 0.0) {
        return false;
    }

    const auto it = index_.find(label);
    if (it != index_.end()) {
        entries_[it->second].km += km;
        return true;
    }

    index_.emplace(label, entries_.size());
    entries_.emplace_back(label, km);
    return true;
}

double Tally::Get(const std::string& label) const {
    const auto it = index_.find(label);
    return it != index_.end() ? entries_[it->second].km : 0.0;
}

bool Tally::Contains(const std::string& label) const {
    return index_.find(label) != index_.end();
}

double Tally::Sum() const {
    double sum = 0.0;
    for (const auto& entry : entries_) {
        sum += entry.km;
    }
    return sum;
}

std::vector<TallyEntry> Tally::Sorted() const {
    std::vector<TallyEntry> sorted = entries_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TallyEntry& a, const TallyEntry& b) {
                         return a.km > b.km;
                     });
    return sorted;
}

void Tally::Clear() {
    entries_.clear();
    index_.clear();
}

} // namespace route_atlas
