#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "poslink/core/transport/error.hpp"


namespace poslink::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        std::string scheme;   // "ws", "wss", "http" or "https"
        bool secure{false};   // true = wss/https, false = ws/http
        std::string host;
        std::string port;
        std::string path;
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser for the two scheme pairs used by a terminal:
    //   ws:// and wss://     (real-time channel)
    //   http:// and https:// (status side channel)
    //
    // Rejects malformed inputs without attempting full RFC compliance.
    // A query string, if any, is kept as part of the path.
    //
    // Example inputs:
    //   ws://localhost:3000/ws
    //   http://10.0.0.5:3000/api
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};

        // 1) Extract scheme
        struct Scheme { std::string_view prefix; bool secure; std::string_view port; };
        constexpr Scheme schemes[] = {
            {"ws://",    false, "80"},
            {"wss://",   true,  "443"},
            {"http://",  false, "80"},
            {"https://", true,  "443"},
        };
        const Scheme* scheme = nullptr;
        for (const auto& s : schemes) {
            if (url.substr(0, s.prefix.size()) == s.prefix) {
                scheme = &s;
                break;
            }
        }
        if (!scheme) {
            return Error::InvalidUrl;
        }
        out.scheme = std::string(scheme->prefix.substr(0, scheme->prefix.size() - 3));
        out.secure = scheme->secure;
        const std::size_t pos = scheme->prefix.size();

        // 2) Extract host[:port]
        const std::size_t slash = url.find('/', pos);
        std::string_view hostport = (slash == std::string_view::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }

        // 3) Split host and port
        const std::size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = std::string(scheme->port);
        }

        // 4) Path (default "/" if missing)
        out.path = (slash == std::string_view::npos) ? std::string("/") : std::string(url.substr(slash));

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        // Port must be numeric and in range
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace poslink::core::transport
