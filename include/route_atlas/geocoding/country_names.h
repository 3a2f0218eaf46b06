// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

#include <string>

namespace route_atlas {

/// Fold a country name onto its canonical spelling.
///
/// Matching is case-insensitive and ignores surrounding whitespace, e.g.
/// "USA", "us" and "United States of America" all become "United States",
/// "uk", "England" or "Scotland" become "United Kingdom". Names without an
/// alias are returned unchanged (including their original whitespace).
/// Idempotent: NormalizeCountryName(NormalizeCountryName(x)) equals
/// NormalizeCountryName(x).
[[nodiscard]] std::string NormalizeCountryName(const std::string& name);

/// True if name has an alias entry (canonical names included)
[[nodiscard]] bool IsKnownCountryAlias(const std::string& name);

/// ASCII lower-casing; bytes outside A-Z are kept as-is
[[nodiscard]] std::string ToLowerAscii(const std::string& text);

/// Strip leading and trailing ASCII whitespace
[[nodiscard]] std::string TrimWhitespace(const std::string& text);

} // namespace route_atlas
