#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "poslink/json/writer.hpp"


namespace poslink::status {

// Reachability reported on the status side channel
enum class HostStatus : std::uint8_t {
    Online,
    Offline,
    Maintenance,
    Error
};

[[nodiscard]]
inline constexpr std::string_view to_string(HostStatus s) noexcept {
    switch (s) {
        case HostStatus::Online:      return "online";
        case HostStatus::Offline:     return "offline";
        case HostStatus::Maintenance: return "maintenance";
        case HostStatus::Error:       return "error";
        default:                      return "unknown";
    }
}

struct HardwareFacts {
    std::string platform;
    std::string user_agent;
    std::string locale;
    std::string screen_resolution;
    std::optional<std::uint64_t> memory_gb;
};

// Immutable description of this terminal, rebuilt for every report
struct Snapshot {
    std::string terminal_id;
    std::string local_address;
    std::uint16_t port{0};
    std::string software_version;
    HardwareFacts hardware;
};


inline void write_json(std::string& out, const HardwareFacts& hw) {
    out += '{';
    json::append_key(out, "platform");
    json::append_string(out, hw.platform);
    out += ',';
    json::append_key(out, "userAgent");
    json::append_string(out, hw.user_agent);
    out += ',';
    json::append_key(out, "language");
    json::append_string(out, hw.locale);
    out += ',';
    json::append_key(out, "screenResolution");
    json::append_string(out, hw.screen_resolution);
    if (hw.memory_gb) {
        out += ',';
        json::append_key(out, "memory");
        json::append(out, *hw.memory_gb);
    }
    out += '}';
}

// Body of the registration upsert
[[nodiscard]]
inline std::string registration_body(const Snapshot& s) {
    std::string out;
    out += '{';
    json::append_key(out, "terminal_id");
    json::append_string(out, s.terminal_id);
    out += ',';
    json::append_key(out, "name");
    json::append_string(out, "Terminal " + s.terminal_id);
    out += ',';
    json::append_key(out, "ip_address");
    json::append_string(out, s.local_address);
    out += ',';
    json::append_key(out, "port");
    json::append(out, static_cast<std::uint64_t>(s.port));
    out += ',';
    json::append_key(out, "software_version");
    json::append_string(out, s.software_version);
    out += ',';
    json::append_key(out, "hardware_info");
    write_json(out, s.hardware);
    out += '}';
    return out;
}

// Body of the status patch
[[nodiscard]]
inline std::string status_body(const Snapshot& s, HostStatus status) {
    std::string out;
    out += '{';
    json::append_key(out, "status");
    json::append_string(out, to_string(status));
    out += ',';
    json::append_key(out, "hardware_info");
    write_json(out, s.hardware);
    out += ',';
    json::append_key(out, "software_version");
    json::append_string(out, s.software_version);
    out += '}';
    return out;
}

} // namespace poslink::status
