/*
================================================================================
 Connection Configuration
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>


namespace poslink::core::transport {

// Upper bound for a single outbound text frame (bytes)
inline constexpr std::size_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;

// Reconnection policy applied by transport::Connection.
//
// delay(n) = base_delay * 2^(n - 1), n = 1..max_attempts
//
// A non-zero jitter adds up to `jitter` milliseconds to each delay. The result
// is clamped against the previous delay of the same outage so that successive
// delays never decrease.
struct ReconnectPolicy {
    std::chrono::milliseconds base_delay{1000};
    int max_attempts{5};
    std::chrono::milliseconds jitter{0};
    std::size_t max_frame_size{DEFAULT_MAX_FRAME_SIZE};
};

} // namespace poslink::core::transport
