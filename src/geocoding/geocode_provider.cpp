// Copyright (c) 2025 Route Atlas Project
// SPDX-License-Identifier: MIT

#include <route_atlas/geocoding/geocode_provider.h>

namespace route_atlas {

const char* GeocodeErrorName(GeocodeError error) noexcept {
    switch (error) {
        case GeocodeError::NONE:
            return "none";
        case GeocodeError::TIMEOUT:
            return "timeout";
        case GeocodeError::NO_RESULT:
            return "no result";
        case GeocodeError::TRANSPORT:
            return "transport";
    }
    return "unknown";
}

} // namespace route_atlas
