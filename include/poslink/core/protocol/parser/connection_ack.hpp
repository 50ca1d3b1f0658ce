#pragma once

#include "poslink/core/protocol/schema/connection_ack.hpp"
#include "poslink/core/protocol/parser/helpers.hpp"
#include "poslink/log/logger.hpp"

#include "simdjson.h"

namespace poslink::core::protocol::parser {

struct connection_ack {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::ConnectionAck& out) noexcept {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] connection_ack payload is not an object -> ignore message.");
            return r;
        }
        r = helper::parse_string_required(root, "terminalId", out.terminal_id);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'terminalId' missing or invalid in connection_ack -> ignore message.");
            return r;
        }
        if (out.terminal_id.empty()) {
            PL_DEBUG("[PARSER] Empty 'terminalId' in connection_ack -> ignore message.");
            return Result::InvalidValue;
        }
        r = helper::parse_string_optional(root, "message", out.message);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'message' invalid in connection_ack -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace poslink::core::protocol::parser
