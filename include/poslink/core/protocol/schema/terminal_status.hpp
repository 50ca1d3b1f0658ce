#pragma once

#include <optional>
#include <string>

#include "poslink/json/writer.hpp"


namespace poslink::core::protocol::schema {

// terminal_status: broadcast of one terminal's status
struct TerminalStatus {
    std::string id;
    std::string name;
    std::string status;         // "active" | "inactive"
    std::string last_activity;  // ISO-8601
    std::optional<std::string> user_id;
    std::optional<std::string> user_role;

    inline void write_json(std::string& out) const {
        out += '{';
        json::append_key(out, "id");
        json::append_string(out, id);
        out += ',';
        json::append_key(out, "name");
        json::append_string(out, name);
        out += ',';
        json::append_key(out, "status");
        json::append_string(out, status);
        out += ',';
        json::append_key(out, "lastActivity");
        json::append_string(out, last_activity);
        if (user_id) {
            out += ',';
            json::append_key(out, "userId");
            json::append_string(out, *user_id);
        }
        if (user_role) {
            out += ',';
            json::append_key(out, "userRole");
            json::append_string(out, *user_role);
        }
        out += '}';
    }
};

} // namespace poslink::core::protocol::schema
