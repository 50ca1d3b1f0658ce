#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

#include "poslink/core/transport/connection/config.hpp"
#include "poslink/status/host_facts.hpp"
#include "poslink/status/http_channel.hpp"
#include "poslink/version.hpp"

namespace CLI {
class App;
} // namespace CLI


namespace poslink {

/*
===============================================================================
 poslink::Config
===============================================================================

Every tunable of a terminal, with the defaults a terminal ships with. Times
are plain millisecond counts so they map one-to-one onto command line options
and config file keys.
===============================================================================
*/

struct Config {
    // Real-time channel
    std::string endpoint            = "ws://localhost:3000/ws";

    // Reconnection policy: delay(n) = base * 2^(n-1), n <= max attempts
    std::int64_t reconnect_base_ms  = 1000;
    int reconnect_max_attempts      = 5;
    std::int64_t reconnect_jitter_ms = 0;
    std::size_t max_frame_size      = core::transport::DEFAULT_MAX_FRAME_SIZE;

    // Status side channel
    std::string api_url             = "http://localhost:3000/api";
    std::string auth_token;
    bool status_reporting           = true;
    std::int64_t status_interval_ms = 30000;
    std::int64_t http_timeout_ms    = 5000;

    // Terminal description
    std::string identity_file;      // empty: identity::FileStore::default_path()
    std::uint16_t port              = 5173;
    std::string software_version    = PL_VERSION_STRING;
    std::string screen_resolution   = "1920x1080";
    std::string fallback_address    = "192.168.1.100";

    std::string log_level           = "info";

    [[nodiscard]]
    core::transport::ReconnectPolicy reconnect_policy() const noexcept;

    [[nodiscard]]
    status::HttpChannelConfig http_channel() const;

    [[nodiscard]]
    status::HostFactsConfig host_facts() const;

    [[nodiscard]]
    std::filesystem::path identity_path() const;

    void dump(const std::string& header, std::ostream& os) const;
};

// Bind every Config field to a CLI11 option (and to --config file keys)
void configure(CLI::App& app, Config& cfg);

// Apply cfg.log_level to the global logger
void apply_log_level(const Config& cfg);

} // namespace poslink
