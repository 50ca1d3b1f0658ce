#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "poslink/json/writer.hpp"


namespace poslink::core::protocol::schema {

enum class ActivityStatus : std::uint8_t {
    Active,
    Inactive
};

[[nodiscard]]
inline constexpr std::string_view to_string(ActivityStatus s) noexcept {
    return s == ActivityStatus::Active ? "active" : "inactive";
}

// terminal_status_update: lightweight liveness ping over the socket
struct TerminalStatusUpdate {
    ActivityStatus status{ActivityStatus::Active};

    inline void write_json(std::string& out) const {
        out += '{';
        json::append_key(out, "status");
        json::append_string(out, to_string(status));
        out += '}';
    }
};

} // namespace poslink::core::protocol::schema
