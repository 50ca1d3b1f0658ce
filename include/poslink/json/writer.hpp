#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <charconv>
#include <cmath>
#include <system_error>


namespace poslink {
namespace json {

// Escape helper (RFC 8259: quote, backslash and control characters)
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

// Quoted, escaped string value
inline void append_string(std::string& out, std::string_view s) {
    out += '\"';
    escape(out, s);
    out += '\"';
}

// "key": (no leading comma)
inline void append_key(std::string& out, std::string_view key) {
    append_string(out, key);
    out += ':';
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value) {
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value) {
    if (value < 0) {
        out += '-';
        // two's complement safe negation
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

inline void append(std::string& out, int value) {
    append(out, static_cast<std::int64_t>(value));
}

// Shortest round-trip representation; non-finite values become null
inline void append(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        out += '0';
        return;
    }
    out.append(buf, ptr);
}

inline void append(std::string& out, bool value) {
    out += value ? "true" : "false";
}

} // namespace json
} // namespace poslink
