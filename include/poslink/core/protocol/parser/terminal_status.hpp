#pragma once

#include "poslink/core/protocol/schema/terminal_status.hpp"
#include "poslink/core/protocol/parser/helpers.hpp"
#include "poslink/log/logger.hpp"

#include "simdjson.h"

namespace poslink::core::protocol::parser {

struct terminal_status {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::TerminalStatus& out) noexcept {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] terminal_status payload is not an object -> ignore message.");
            return r;
        }
        r = helper::parse_id_required(root, "id", out.id);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'id' missing or invalid in terminal_status -> ignore message.");
            return r;
        }
        r = helper::parse_string_required(root, "name", out.name);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'name' missing or invalid in terminal_status -> ignore message.");
            return r;
        }
        r = helper::parse_string_required(root, "status", out.status);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'status' missing or invalid in terminal_status -> ignore message.");
            return r;
        }
        r = helper::parse_string_required(root, "lastActivity", out.last_activity);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'lastActivity' missing or invalid in terminal_status -> ignore message.");
            return r;
        }
        r = helper::parse_string_optional(root, "userId", out.user_id);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'userId' invalid in terminal_status -> ignore message.");
            return r;
        }
        r = helper::parse_string_optional(root, "userRole", out.user_role);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'userRole' invalid in terminal_status -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace poslink::core::protocol::parser
