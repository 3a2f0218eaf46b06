// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file library_info.h
 * @brief Library information and utilities
 *
 * Provides version information, build details and the versions of the
 * libraries the build links against.
 */

#include <string>

namespace route_atlas {

/**
 * @brief Library information and utilities
 */
class LibraryInfo {
public:
    /**
     * @brief Get library version
     *
     * @return std::string Version string in format "major.minor.patch"
     */
    static std::string GetVersion();

    /**
     * @brief Get build information
     *
     * @return std::string Build timestamp and configuration
     */
    static std::string GetBuildInfo();

    /**
     * @brief Get versions of the linked third-party libraries
     *
     * @return std::string e.g. "spdlog 1.12.0, nlohmann_json 3.11.3, libcurl 8.5.0"
     */
    static std::string GetDependencyInfo();
};

} // namespace route_atlas
