#include "poslink/config.hpp"

#include <CLI/CLI.hpp>

#include "poslink/cli/validators.hpp"
#include "poslink/identity/file_store.hpp"
#include "poslink/log/logger.hpp"


namespace poslink {

core::transport::ReconnectPolicy Config::reconnect_policy() const noexcept {
    core::transport::ReconnectPolicy policy;
    policy.base_delay = std::chrono::milliseconds(reconnect_base_ms);
    policy.max_attempts = reconnect_max_attempts;
    policy.jitter = std::chrono::milliseconds(reconnect_jitter_ms);
    policy.max_frame_size = max_frame_size;
    return policy;
}

status::HttpChannelConfig Config::http_channel() const {
    status::HttpChannelConfig cfg;
    cfg.api_url = api_url;
    cfg.auth_token = auth_token;
    cfg.timeout = std::chrono::milliseconds(http_timeout_ms);
    return cfg;
}

status::HostFactsConfig Config::host_facts() const {
    status::HostFactsConfig cfg;
    cfg.port = port;
    cfg.software_version = software_version;
    cfg.screen_resolution = screen_resolution;
    cfg.fallback_address = fallback_address;
    return cfg;
}

std::filesystem::path Config::identity_path() const {
    return identity_file.empty() ? identity::FileStore::default_path() : std::filesystem::path(identity_file);
}

void Config::dump(const std::string& header, std::ostream& os) const {
    os << header << ":\n"
       << "  Endpoint        : " << endpoint << "\n"
       << "  Reconnect       : base " << reconnect_base_ms << " ms, max " << reconnect_max_attempts
       << " attempts, jitter " << reconnect_jitter_ms << " ms\n"
       << "  API             : " << api_url << (auth_token.empty() ? "" : " (token set)") << "\n"
       << "  Status          : " << (status_reporting ? "every " + std::to_string(status_interval_ms) + " ms" : std::string("disabled")) << "\n"
       << "  Identity file   : " << identity_path().string() << "\n"
       << "  Port / Version  : " << port << " / " << software_version << "\n"
       << "  Log Level       : " << log_level << "\n";
}

void configure(CLI::App& app, Config& cfg) {
    app.set_config("--config", "", "Read options from an INI/TOML file");

    app.add_option("-u,--url", cfg.endpoint, "WebSocket endpoint")
        ->check(cli::ws_url_validator)->capture_default_str();
    app.add_option("--reconnect-base-ms", cfg.reconnect_base_ms, "Base reconnection delay (ms)")
        ->check(CLI::Range(std::int64_t{0}, std::int64_t{3600000}))->capture_default_str();
    app.add_option("--reconnect-max-attempts", cfg.reconnect_max_attempts, "Reconnection attempts before giving up")
        ->check(CLI::Range(0, 1000))->capture_default_str();
    app.add_option("--reconnect-jitter-ms", cfg.reconnect_jitter_ms, "Random extra delay per attempt (ms, 0 = off)")
        ->check(CLI::Range(std::int64_t{0}, std::int64_t{60000}))->capture_default_str();
    app.add_option("--max-frame-size", cfg.max_frame_size, "Largest outbound frame (bytes)")
        ->check(CLI::PositiveNumber)->capture_default_str();

    app.add_option("--api-url", cfg.api_url, "Terminal registry base URL")
        ->check(cli::http_url_validator)->capture_default_str();
    app.add_option("--auth-token", cfg.auth_token, "Bearer token for the registry")
        ->envname("POSLINK_AUTH_TOKEN");
    app.add_flag("!--no-status", cfg.status_reporting, "Disable status reporting");
    app.add_option("--status-interval-ms", cfg.status_interval_ms, "Status report interval (ms)")
        ->check(CLI::Range(std::int64_t{1000}, std::int64_t{86400000}))->capture_default_str();
    app.add_option("--http-timeout-ms", cfg.http_timeout_ms, "Registry request timeout (ms)")
        ->check(CLI::Range(std::int64_t{100}, std::int64_t{120000}))->capture_default_str();

    app.add_option("--identity-file", cfg.identity_file, "Where the terminal identity is persisted");
    app.add_option("--port", cfg.port, "Port announced to the registry")->capture_default_str();
    app.add_option("--software-version", cfg.software_version, "Version announced to the registry")->capture_default_str();
    app.add_option("--screen", cfg.screen_resolution, "Screen resolution announced to the registry")
        ->check(cli::resolution_validator)->capture_default_str();
    app.add_option("--fallback-address", cfg.fallback_address, "Address announced when none can be detected")
        ->check(CLI::ValidIPV4)->capture_default_str();

    app.add_option("-l,--log-level", cfg.log_level, "Log level: trace | debug | info | warn | error")
        ->check(cli::log_level_validator)->capture_default_str();
}

void apply_log_level(const Config& cfg) {
    log::Logger::instance().set_level(log::level_from_string(cfg.log_level));
}

} // namespace poslink
