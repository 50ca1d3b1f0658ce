#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <cstdlib>
#include <cstdio>
#include <cctype>

namespace poslink::core {

// ============================================================================
// Timestamp type (wall clock, millisecond resolution on the wire)
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

[[nodiscard]]
inline Timestamp now_utc() noexcept {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}


namespace detail {

inline bool parse_int(std::string_view sv, int& out) noexcept {
    if (sv.empty()) return false;
    int value = 0;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace detail


// ============================================================================
// ISO-8601 / RFC3339 parser (UTC only)
//
// Supports:
//   YYYY-MM-DDTHH:MM:SSZ
//   YYYY-MM-DDTHH:MM:SS.sss...Z   (fraction truncated to milliseconds)
// ============================================================================
[[nodiscard]]
inline bool parse_iso8601(std::string_view sv, Timestamp& out) noexcept {
    using namespace std::chrono;

    // Minimum length: "YYYY-MM-DDTHH:MM:SSZ" (20 chars)
    if (sv.size() < 20) return false;

    int year = 0, mon = 0, day = 0;
    if (!detail::parse_int(sv.substr(0, 4), year)) return false;
    if (sv[4] != '-') return false;
    if (!detail::parse_int(sv.substr(5, 2), mon)) return false;
    if (sv[7] != '-') return false;
    if (!detail::parse_int(sv.substr(8, 2), day)) return false;

    if (sv[10] != 'T' && sv[10] != 't') return false;

    int hour = 0, minute = 0, sec = 0;
    if (!detail::parse_int(sv.substr(11, 2), hour)) return false;
    if (sv[13] != ':') return false;
    if (!detail::parse_int(sv.substr(14, 2), minute)) return false;
    if (sv[16] != ':') return false;
    if (!detail::parse_int(sv.substr(17, 2), sec)) return false;
    if (hour > 23 || minute > 59 || sec > 60) return false;

    milliseconds extra_ms{0};
    size_t pos = 19;
    if (pos < sv.size() && sv[pos] == '.') {
        size_t start = ++pos;
        while (pos < sv.size() && std::isdigit(static_cast<unsigned char>(sv[pos])))
            pos++;
        size_t digits = pos - start;
        if (digits == 0) return false;
        int frac = 0;
        // keep the first three digits only
        std::string_view head = sv.substr(start, digits < 3 ? digits : 3);
        if (!detail::parse_int(head, frac)) return false;
        for (size_t i = head.size(); i < 3; ++i)
            frac *= 10;
        extra_ms = milliseconds(frac);
    }

    if (pos >= sv.size() || (sv[pos] != 'Z' && sv[pos] != 'z')) return false;

    year_month_day ymd =
        std::chrono::year{year} /
        std::chrono::month{static_cast<unsigned>(mon)} /
        std::chrono::day{static_cast<unsigned>(day)};
    if (!ymd.ok()) return false;

    out = sys_days{ymd} + hours(hour) + minutes(minute) + seconds(sec) + extra_ms;
    return true;
}


// ============================================================================
// ISO-8601 formatter (always UTC)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.sssZ
// ============================================================================
[[nodiscard]]
inline std::string to_iso8601(const Timestamp& ts) {
    using namespace std::chrono;

    sys_days d = floor<days>(ts);
    year_month_day ymd{d};

    auto tod = ts - d;
    auto h = floor<hours>(tod);
    auto m = floor<minutes>(tod - h);
    auto s = floor<seconds>(tod - h - m);
    auto ms = (tod - h - m - s).count();

    char buf[40];
    std::snprintf(buf, sizeof(buf),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
                  int(h.count()), int(m.count()), int(s.count()),
                  static_cast<int>(ms));
    return std::string(buf);
}

} // namespace poslink::core
