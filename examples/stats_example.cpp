// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

// route_atlas_stats: per-country and per-city distance summary of a route file

#include <route_atlas/route_atlas.h>
#include <route_atlas/platform/library_info.h>
#include <route_atlas/stats/snapshot_channel.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kTopEntries = 3;
constexpr long kMaxDays = 36500;

struct CommandLine {
    std::string routes_path;
    std::optional<std::string> config_path;
    std::optional<std::string> cache_directory;
    bool network = false;
    bool verbose = false;
    route_atlas::RouteFilter filter;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <routes.json> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>        JSON configuration file\n"
              << "  --cache-dir <dir>      Geocode cache directory\n"
              << "  --network              Use the network reverse geocoder\n"
              << "  --days <N>             Only routes of the last N days\n"
              << "  --category <list>      Comma-separated categories (running,walking,cycling,other)\n"
              << "  --verbose              Debug logging\n"
              << "  --version              Print version information\n"
              << "  --help                 Show this help\n";
}

bool parse_categories(const std::string& list, std::vector<route_atlas::RouteCategory>& categories) {
    std::stringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto category = route_atlas::ParseRouteCategory(item);
        if (!category) {
            std::cerr << "Unknown category: " << item << "\n";
            return false;
        }
        categories.push_back(*category);
    }
    return !categories.empty();
}

/// @return false on a usage error
bool parse_command_line(int argc, char** argv, CommandLine& command_line) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            command_line.config_path = argv[++i];
        } else if (arg == "--cache-dir" && has_value) {
            command_line.cache_directory = argv[++i];
        } else if (arg == "--network") {
            command_line.network = true;
        } else if (arg == "--verbose") {
            command_line.verbose = true;
        } else if (arg == "--days" && has_value) {
            char* end = nullptr;
            const long days = std::strtol(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0' || days <= 0 || days > kMaxDays) {
                std::cerr << "--days expects an integer between 1 and " << kMaxDays << "\n";
                return false;
            }
            command_line.filter.max_age_days = static_cast<int>(days);
        } else if (arg == "--category" && has_value) {
            if (!parse_categories(argv[++i], command_line.filter.categories)) {
                return false;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return false;
        } else if (command_line.routes_path.empty()) {
            command_line.routes_path = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }
    return !command_line.routes_path.empty();
}

void print_top(const char* title, const std::vector<route_atlas::TallyEntry>& entries) {
    std::cout << title << ":\n";
    if (entries.empty()) {
        std::cout << "  (none)\n";
        return;
    }
    for (std::size_t i = 0; i < entries.size() && i < kTopEntries; ++i) {
        std::cout << "  " << (i + 1) << ". " << std::left << std::setw(28) << entries[i].label
                  << std::right << std::fixed << std::setprecision(1) << std::setw(9)
                  << entries[i].km << " km\n";
    }
}

void print_summary(const route_atlas::Snapshot& snapshot) {
    std::cout << "\nYou ran " << std::fixed << std::setprecision(1) << snapshot.total_km
              << " km in total\n\n";
    print_top("Top countries", snapshot.countries);
    std::cout << "\n";
    print_top("Top cities", snapshot.cities);

    const auto& diagnostics = snapshot.diagnostics;
    std::cout << "\n" << snapshot.total << " routes, " << snapshot.unique_coords
              << " unique locations, " << snapshot.geocoded_count << " newly geocoded\n";
    if (diagnostics.DiscardedRoutes() + diagnostics.invalid_coordinate_routes > 0) {
        std::cout << "Skipped routes: " << diagnostics.DiscardedRoutes()
                  << " without usable distance, " << diagnostics.invalid_coordinate_routes
                  << " with invalid coordinates\n";
    }
    if (diagnostics.network_failures > 0) {
        std::cout << "Failed lookups: " << diagnostics.network_failures << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            std::cout << route_atlas::LibraryInfo::GetBuildInfo() << "\n"
                      << route_atlas::LibraryInfo::GetDependencyInfo() << "\n";
            return 0;
        }
    }

    CommandLine command_line;
    if (!parse_command_line(argc, argv, command_line)) {
        print_usage(argv[0]);
        return 1;
    }

    route_atlas::Configuration config;
    std::string error_message;
    if (command_line.config_path &&
        !route_atlas::LoadConfiguration(*command_line.config_path, config, error_message)) {
        std::cerr << "Configuration error: " << error_message << "\n";
        return 1;
    }
    if (command_line.cache_directory) {
        config.cache_directory = *command_line.cache_directory;
    }
    if (command_line.network) {
        config.geocoder = route_atlas::GeocoderKind::NETWORK;
    }
    if (command_line.verbose) {
        config.log_level = "debug";
    }
    if (!route_atlas::ValidateConfiguration(config, error_message)) {
        std::cerr << "Configuration error: " << error_message << "\n";
        return 1;
    }
    if (!route_atlas::ApplyLogLevel(config)) {
        return 1;
    }

    spdlog::debug("{}", route_atlas::LibraryInfo::GetBuildInfo());

    auto atlas = route_atlas::RouteAtlas::Create(config);
    if (!atlas) {
        std::cerr << "Failed to initialize Route Atlas\n";
        return 1;
    }

    const route_atlas::RouteLoadResult loaded = atlas->LoadRoutes(command_line.routes_path);
    if (!loaded.success) {
        std::cerr << "Cannot load routes: " << loaded.error_message << "\n";
        return 1;
    }

    std::vector<route_atlas::Route> routes =
        route_atlas::FilterRoutes(loaded.routes, command_line.filter);
    spdlog::info("route_atlas_stats: {} of {} routes selected", routes.size(), loaded.routes.size());

    route_atlas::SnapshotChannel channel;
    atlas->StartAggregation(std::move(routes), channel.MakeCallback());

    std::optional<route_atlas::Snapshot> final_snapshot;
    while (!final_snapshot) {
        auto snapshot = channel.WaitPop(std::chrono::milliseconds(250));
        if (!snapshot) {
            if (atlas->GetAggregator().WaitFor(std::chrono::milliseconds(0)) && channel.Empty()) {
                std::cerr << "Aggregation stopped without a result\n";
                return 1;
            }
            continue;
        }
        if (snapshot->done) {
            final_snapshot = std::move(snapshot);
        } else {
            std::cout << "Processing... " << snapshot->processed << "/" << snapshot->total
                      << " routes, " << std::fixed << std::setprecision(1)
                      << snapshot->CountrySum() << " km located\n";
        }
    }

    atlas->Wait();
    print_summary(*final_snapshot);
    return 0;
}
