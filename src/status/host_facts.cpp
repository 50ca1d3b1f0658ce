#include "poslink/status/host_facts.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>

#include "poslink/log/logger.hpp"
#include "poslink/version.hpp"


namespace poslink::status {

namespace {

// RAII wrapper for getifaddrs()
class InterfaceList {
public:
    InterfaceList() {
        if (::getifaddrs(&head_) != 0) {
            PL_WARN("[STATUS] getifaddrs failed: " << std::strerror(errno));
            head_ = nullptr;
        }
    }

    ~InterfaceList() {
        if (head_) {
            ::freeifaddrs(head_);
        }
    }

    InterfaceList(const InterfaceList&) = delete;
    InterfaceList& operator=(const InterfaceList&) = delete;

    const ::ifaddrs* head() const noexcept { return head_; }

private:
    ::ifaddrs* head_{nullptr};
};

bool usable(const ::ifaddrs* ifa) noexcept {
    const unsigned flags = ifa->ifa_flags;
    return (flags & IFF_UP) && (flags & IFF_RUNNING) && !(flags & IFF_LOOPBACK);
}

} // namespace


HostFacts::HostFacts(HostFactsConfig cfg)
    : cfg_(std::move(cfg))
{
    if (cfg_.software_version.empty()) {
        cfg_.software_version = PL_VERSION_STRING;
    }
}

Snapshot HostFacts::snapshot(const std::string& terminal_id) const {
    Snapshot s;
    s.terminal_id = terminal_id;
    s.local_address = local_address();
    s.port = cfg_.port;
    s.software_version = cfg_.software_version;
    s.hardware.platform = platform();
    s.hardware.user_agent = user_agent(cfg_.software_version);
    s.hardware.locale = locale();
    s.hardware.screen_resolution = cfg_.screen_resolution;
    s.hardware.memory_gb = memory_gb();
    return s;
}

bool HostFacts::network_available() const {
    InterfaceList list;
    for (const ::ifaddrs* ifa = list.head(); ifa; ifa = ifa->ifa_next) {
        if (usable(ifa)) {
            return true;
        }
    }
    return false;
}

std::string HostFacts::local_address() const {
    InterfaceList list;
    for (const ::ifaddrs* ifa = list.head(); ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET || !usable(ifa)) {
            continue;
        }
        char buf[INET_ADDRSTRLEN] = {};
        const auto* sin = reinterpret_cast<const ::sockaddr_in*>(ifa->ifa_addr);
        if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            return buf;
        }
    }
    PL_DEBUG("[STATUS] No usable IPv4 interface, using fallback address " << cfg_.fallback_address);
    return cfg_.fallback_address;
}

std::string HostFacts::platform() {
    ::utsname u{};
    if (::uname(&u) != 0) {
        return "unknown";
    }
    return std::string(u.sysname) + " " + u.machine;
}

std::string HostFacts::user_agent(const std::string& software_version) {
    std::string ua = "poslink/" + software_version;
    ::utsname u{};
    if (::uname(&u) == 0) {
        ua += " (";
        ua += u.sysname;
        ua += ' ';
        ua += u.release;
        ua += "; ";
        ua += u.machine;
        ua += ')';
    }
    return ua;
}

std::string HostFacts::locale() {
    const char* raw = nullptr;
    for (const char* var : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
        const char* v = std::getenv(var);
        if (v && *v) {
            raw = v;
            break;
        }
    }
    if (!raw) {
        return "en-US";
    }
    std::string tag(raw);
    // Strip ".UTF-8" and "@modifier"
    if (const auto cut = tag.find_first_of(".@"); cut != std::string::npos) {
        tag.erase(cut);
    }
    if (tag.empty() || tag == "C" || tag == "POSIX") {
        return "en-US";
    }
    for (char& c : tag) {
        if (c == '_') c = '-';
    }
    return tag;
}

std::optional<std::uint64_t> HostFacts::memory_gb() {
    struct ::sysinfo info{};
    if (::sysinfo(&info) != 0) {
        return std::nullopt;
    }
    constexpr std::uint64_t GiB = 1024ull * 1024ull * 1024ull;
    const std::uint64_t total = static_cast<std::uint64_t>(info.totalram) * info.mem_unit;
    return (total + GiB / 2) / GiB;
}

} // namespace poslink::status
