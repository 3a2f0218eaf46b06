// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/geocoding/country_names.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace route_atlas {

namespace {

/// Lower-case alias -> canonical name.
/// Canonical names map onto themselves so that case variants fold too.
const std::unordered_map<std::string, std::string>& AliasTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {"usa", "United States"},
        {"us", "United States"},
        {"u.s.", "United States"},
        {"u.s.a.", "United States"},
        {"united states", "United States"},
        {"united states of america", "United States"},

        {"uk", "United Kingdom"},
        {"u.k.", "United Kingdom"},
        {"britain", "United Kingdom"},
        {"great britain", "United Kingdom"},
        {"england", "United Kingdom"},
        {"scotland", "United Kingdom"},
        {"wales", "United Kingdom"},
        {"northern ireland", "United Kingdom"},
        {"united kingdom", "United Kingdom"},

        {"deutschland", "Germany"},
        {"germany", "Germany"},

        {"nederland", "Netherlands"},
        {"holland", "Netherlands"},
        {"the netherlands", "Netherlands"},
        {"netherlands", "Netherlands"},

        {"czechia", "Czech Republic"},
        {"czech republic", "Czech Republic"},
    };
    return table;
}

} // anonymous namespace

std::string ToLowerAscii(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string TrimWhitespace(const std::string& text) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

std::string NormalizeCountryName(const std::string& name) {
    const auto& table = AliasTable();
    const auto it = table.find(ToLowerAscii(TrimWhitespace(name)));
    if (it == table.end()) {
        return name;
    }
    return it->second;
}

bool IsKnownCountryAlias(const std::string& name) {
    const auto& table = AliasTable();
    return table.find(ToLowerAscii(TrimWhitespace(name))) != table.end();
}

} // namespace route_atlas
