#pragma once

#define PL_VERSION_MAJOR 1
#define PL_VERSION_MINOR 0
#define PL_VERSION_PATCH 0
#define PL_VERSION_STRING "1.0.0"

namespace poslink {

inline constexpr const char* version() noexcept {
    return PL_VERSION_STRING;
}

} // namespace poslink
