#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "poslink/core/transport/parse_url.hpp"


namespace poslink::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::transport::ParsedUrl url;
        if (core::transport::parse_url(value, url) != core::transport::Error::None) {
            return "Malformed URL: " + value;
        }
        if (url.scheme != "ws") {
            return "URL must start with ws://";
        }
        return {};
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// HTTP API base URL validator
// -------------------------------------------------------------
inline auto http_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::transport::ParsedUrl url;
        if (core::transport::parse_url(value, url) != core::transport::Error::None) {
            return "Malformed URL: " + value;
        }
        if (url.scheme != "http") {
            return "URL must start with http://";
        }
        return {};
    },
    "HTTP URL validator"
);


// -------------------------------------------------------------
// Screen resolution validator (WIDTHxHEIGHT)
// -------------------------------------------------------------
inline auto resolution_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const auto x = value.find('x');
        if (x == std::string::npos || x == 0 || x + 1 == value.size()) {
            return "Resolution must be WIDTHxHEIGHT (e.g. 1920x1080)";
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (i != x && (value[i] < '0' || value[i] > '9')) {
                return "Resolution must be WIDTHxHEIGHT (e.g. 1920x1080)";
            }
        }
        return {};
    },
    "Screen resolution validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"});

} // namespace poslink::cli
