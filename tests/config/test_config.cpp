/*
===============================================================================
 poslink::Config / CLI binding - Unit Tests
===============================================================================

Covered Requirements:
---------------------
G1. Defaults: 1000 ms base delay, 5 attempts, no jitter, 30 s status interval
G2. Command line options map onto the reconnection policy, the registry
    channel and the host facts
G3. Malformed or unsupported URLs are rejected at parse time (wss:// included)
G4. Range, resolution, address and log level checks
G5. The bearer token can come from the environment
===============================================================================
*/

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

#include <CLI/CLI.hpp>

#include "poslink/config.hpp"
#include "poslink/log/logger.hpp"
#include "common/test_check.hpp"

using poslink::Config;


// Parse a command line (program name excluded) into a fresh Config
static Config parse(const std::string& args) {
    CLI::App app{"test"};
    Config cfg;
    poslink::configure(app, cfg);
    app.parse(args, false);
    return cfg;
}

static bool rejected(const std::string& args) {
    try {
        (void)parse(args);
    }
    catch (const CLI::ParseError&) {
        return true;
    }
    return false;
}


void test_defaults() {
    std::cout << "[TEST] Group G1: defaults\n";
    const Config cfg = parse("");

    const auto policy = cfg.reconnect_policy();
    TEST_CHECK(policy.base_delay == std::chrono::milliseconds(1000));
    TEST_CHECK(policy.max_attempts == 5);
    TEST_CHECK(policy.jitter == std::chrono::milliseconds(0));

    TEST_CHECK(cfg.endpoint.rfind("ws://", 0) == 0);
    TEST_CHECK(cfg.status_reporting);
    TEST_CHECK(cfg.status_interval_ms == 30000);
    TEST_CHECK(cfg.http_channel().timeout == std::chrono::milliseconds(5000));
    TEST_CHECK(cfg.http_channel().auth_token.empty());
    TEST_CHECK(cfg.host_facts().port == 5173);
    TEST_CHECK(cfg.host_facts().software_version == PL_VERSION_STRING);
    TEST_CHECK(!cfg.identity_path().empty());

    std::ostringstream os;
    cfg.dump("Configuration", os);
    TEST_CHECK(os.str().find("every 30000 ms") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_overrides() {
    std::cout << "[TEST] Group G2: overrides\n";
    const Config cfg = parse(
        "--url ws://pos-gw.local:8080/rt --reconnect-base-ms 250 --reconnect-max-attempts 3 "
        "--reconnect-jitter-ms 40 --api-url http://registry.local/api --auth-token abc "
        "--no-status --status-interval-ms 5000 --http-timeout-ms 1500 "
        "--identity-file /tmp/poslink-id --port 9000 --software-version 2.0.1 "
        "--screen 1024x768 --fallback-address 10.0.0.5 -l debug");

    TEST_CHECK(cfg.endpoint == "ws://pos-gw.local:8080/rt");

    const auto policy = cfg.reconnect_policy();
    TEST_CHECK(policy.base_delay == std::chrono::milliseconds(250));
    TEST_CHECK(policy.max_attempts == 3);
    TEST_CHECK(policy.jitter == std::chrono::milliseconds(40));

    const auto http = cfg.http_channel();
    TEST_CHECK(http.api_url == "http://registry.local/api");
    TEST_CHECK(http.auth_token == "abc");
    TEST_CHECK(http.timeout == std::chrono::milliseconds(1500));

    TEST_CHECK(!cfg.status_reporting);
    TEST_CHECK(cfg.status_interval_ms == 5000);

    const auto facts = cfg.host_facts();
    TEST_CHECK(facts.port == 9000);
    TEST_CHECK(facts.software_version == "2.0.1");
    TEST_CHECK(facts.screen_resolution == "1024x768");
    TEST_CHECK(facts.fallback_address == "10.0.0.5");

    TEST_CHECK(cfg.identity_path() == std::filesystem::path("/tmp/poslink-id"));
    TEST_CHECK(cfg.log_level == "debug");

    std::cout << "[TEST] OK\n";
}

void test_url_checks() {
    std::cout << "[TEST] Group G3: URL checks\n";
    TEST_CHECK(rejected("--url wss://secure.example.com/ws"));
    TEST_CHECK(rejected("--url http://example.com/ws"));
    TEST_CHECK(rejected("--url not-a-url"));
    TEST_CHECK(rejected("--api-url https://registry.example.com/api"));
    TEST_CHECK(rejected("--api-url ws://registry.example.com/api"));
    TEST_CHECK(!rejected("--url ws://127.0.0.1:3000/ws --api-url http://127.0.0.1:3000/api"));
    std::cout << "[TEST] OK\n";
}

void test_value_checks() {
    std::cout << "[TEST] Group G4: value checks\n";
    TEST_CHECK(rejected("--reconnect-base-ms=-1"));
    TEST_CHECK(rejected("--reconnect-max-attempts=-2"));
    TEST_CHECK(rejected("--status-interval-ms 10"));
    TEST_CHECK(rejected("--screen 1920"));
    TEST_CHECK(rejected("--screen x1080"));
    TEST_CHECK(rejected("--screen 19a0x1080"));
    TEST_CHECK(rejected("--fallback-address 300.1.1.1"));
    TEST_CHECK(rejected("-l verbose"));
    TEST_CHECK(!rejected("--reconnect-max-attempts 0 -l trace"));
    std::cout << "[TEST] OK\n";
}

void test_env_token() {
    std::cout << "[TEST] Group G5: token from environment\n";
    ::setenv("POSLINK_AUTH_TOKEN", "from-env", 1);
    TEST_CHECK(parse("").auth_token == "from-env");
    TEST_CHECK(parse("--auth-token explicit").auth_token == "explicit");
    ::unsetenv("POSLINK_AUTH_TOKEN");
    TEST_CHECK(parse("").auth_token.empty());
    std::cout << "[TEST] OK\n";
}

int main() {
    poslink::log::Logger::instance().set_level(poslink::log::Level::Warn);

    test_defaults();
    test_overrides();
    test_url_checks();
    test_value_checks();
    test_env_token();

    std::cout << "\n[CONFIG TESTS PASSED]\n";
    return 0;
}
