#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "poslink/status/snapshot.hpp"


namespace poslink::status {

struct HostFactsConfig {
    std::uint16_t port{5173};
    std::string software_version;
    std::string screen_resolution{"1920x1080"};
    std::string fallback_address{"192.168.1.100"};
};

// Reads observable facts about the host (POSIX: uname, sysinfo, getifaddrs)
class HostFacts {
public:
    explicit HostFacts(HostFactsConfig cfg);

    // Fresh snapshot for the given terminal identity
    [[nodiscard]]
    Snapshot snapshot(const std::string& terminal_id) const;

    // True if at least one non-loopback interface is up and running
    [[nodiscard]]
    bool network_available() const;

    [[nodiscard]]
    std::string local_address() const;

    // "<sysname> <machine>", e.g. "Linux x86_64"
    [[nodiscard]]
    static std::string platform();

    // "poslink/<version> (<sysname> <release>; <machine>)"
    [[nodiscard]]
    static std::string user_agent(const std::string& software_version);

    // BCP 47 style tag from LC_ALL / LC_MESSAGES / LANG ("en_US.UTF-8" -> "en-US")
    [[nodiscard]]
    static std::string locale();

    // Installed RAM rounded to whole gigabytes
    [[nodiscard]]
    static std::optional<std::uint64_t> memory_gb();

private:
    HostFactsConfig cfg_;
};

} // namespace poslink::status
