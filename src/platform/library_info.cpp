// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/platform/library_info.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/version.h>

#include <sstream>

#ifndef ROUTE_ATLAS_VERSION
#define ROUTE_ATLAS_VERSION "0.1.0"
#endif

namespace route_atlas {

std::string LibraryInfo::GetVersion() {
    return ROUTE_ATLAS_VERSION;
}

std::string LibraryInfo::GetBuildInfo() {
    std::ostringstream oss;
    oss << "Route Atlas " << GetVersion() << " - Built on " << __DATE__ << " " << __TIME__;
    return oss.str();
}

std::string LibraryInfo::GetDependencyInfo() {
    const curl_version_info_data* curl_info = curl_version_info(CURLVERSION_NOW);

    std::ostringstream oss;
    oss << "spdlog " << SPDLOG_VER_MAJOR << "." << SPDLOG_VER_MINOR << "." << SPDLOG_VER_PATCH
        << ", nlohmann_json " << NLOHMANN_JSON_VERSION_MAJOR << "."
        << NLOHMANN_JSON_VERSION_MINOR << "." << NLOHMANN_JSON_VERSION_PATCH
        << ", libcurl " << (curl_info != nullptr ? curl_info->version : "unknown");
    return oss.str();
}

} // namespace route_atlas
