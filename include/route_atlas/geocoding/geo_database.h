// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <route_atlas/coordinates/coordinate_spaces.h>

#include <cstddef>
#include <string>
#include <vector>

namespace route_atlas {

/// Named city marker inside a country
struct CityMarker {
    std::string name;                  ///< Display name
    coordinates::Geographic location;  ///< City center
};

/// Country with its approximate extent and its major cities
struct CountryRegion {
    std::string name;                     ///< Canonical country name
    std::string code;                     ///< ISO 3166-1 alpha-2 code
    coordinates::GeographicBounds bounds; ///< Axis-aligned extent
    std::vector<CityMarker> cities;       ///< Major cities, table order
};

/// Read-only table of country bounding boxes and major-city coordinates.
/// Immutable for the lifetime of the process; the geocoder scans it in
/// declaration order.
class GeoDatabase {
public:
    /// Build a database from an explicit country list (table order kept)
    explicit GeoDatabase(std::vector<CountryRegion> countries);

    /// The compiled-in table
    [[nodiscard]] static const GeoDatabase& Default();

    [[nodiscard]] const std::vector<CountryRegion>& GetCountries() const noexcept {
        return countries_;
    }

    /// Find a country by ISO code (case-insensitive)
    /// @return Pointer into the table, or nullptr
    [[nodiscard]] const CountryRegion* FindByCode(const std::string& code) const;

    /// Find a country by canonical name (case-insensitive)
    /// @return Pointer into the table, or nullptr
    [[nodiscard]] const CountryRegion* FindByName(const std::string& name) const;

    [[nodiscard]] std::size_t GetCountryCount() const noexcept {
        return countries_.size();
    }

    /// Total number of city markers across all countries
    [[nodiscard]] std::size_t GetCityCount() const noexcept;

private:
    std::vector<CountryRegion> countries_;
};

} // namespace route_atlas
