// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace route_atlas {

/// One label of a tally and its accumulated distance
struct TallyEntry {
    std::string label;
    double km;

    TallyEntry() : km(0.0) {}
    TallyEntry(std::string entry_label, double entry_km)
        : label(std::move(entry_label)), km(entry_km) {}
};

/// Label -> accumulated kilometers.
/// Labels keep their first-insertion position so that Sorted() orders
/// equal values deterministically.
class Tally {
public:
    Tally() = default;

    /// Add km to label
    /// @return False (and no change) if km is negative or not finite
    [[nodiscard]] bool Add(const std::string& label, double km);

    /// Accumulated km of label, 0 if absent
    [[nodiscard]] double Get(const std::string& label) const;

    [[nodiscard]] bool Contains(const std::string& label) const;

    /// Sum over all labels
    [[nodiscard]] double Sum() const;

    [[nodiscard]] std::size_t Size() const noexcept {
        return entries_.size();
    }

    [[nodiscard]] bool Empty() const noexcept {
        return entries_.empty();
    }

    /// Entries by km descending; equal values keep insertion order
    [[nodiscard]] std::vector<TallyEntry> Sorted() const;

    void Clear();

private:
    std::vector<TallyEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace route_atlas
