#pragma once

#include <string>
#include <string_view>

#include "poslink/core/protocol/message.hpp"
#include "poslink/core/protocol/parser/result.hpp"
#include "poslink/core/protocol/parser/helpers.hpp"
#include "poslink/json/writer.hpp"
#include "poslink/log/logger.hpp"

#include "simdjson.h"


namespace poslink::core::protocol {

/*
===============================================================================
 protocol::Codec
===============================================================================

Serializes and deserializes the wire envelope (see protocol::Message).

  • encode() never fails; the payload text is trusted to be valid JSON
    (use normalize() on caller-provided documents first)
  • decode() validates the envelope only; payload shape is checked later by
    the typed payload parsers, on demand
  • A Codec owns one simdjson parser and is not thread-safe

Decode rules:
  • malformed JSON                       → InvalidJson
  • root not an object, missing "type"   → InvalidSchema
  • missing "payload"                    → payload = null
  • missing "timestamp" / "terminalId"   → accepted, left empty
===============================================================================
*/

class Codec {
public:
    [[nodiscard]]
    inline std::string encode(const Message& msg) const {
        std::string out;
        out.reserve(64 + msg.type.size() + msg.payload.size());
        out += '{';
        json::append_key(out, "type");
        json::append_string(out, msg.type);
        out += ',';
        json::append_key(out, "payload");
        out += msg.payload.empty() ? std::string_view("null") : std::string_view(msg.payload);
        if (msg.terminal_id) {
            out += ',';
            json::append_key(out, "terminalId");
            json::append_string(out, *msg.terminal_id);
        }
        if (!msg.timestamp.empty()) {
            out += ',';
            json::append_key(out, "timestamp");
            json::append_string(out, msg.timestamp);
        }
        out += '}';
        return out;
    }

    [[nodiscard]]
    inline parser::Result decode(std::string_view text, Message& out) noexcept {
        simdjson::dom::element root;
        if (parser_.parse(text.data(), text.size()).get(root)) {
            PL_WARN("[CODEC] Malformed frame dropped (" << text.size() << " bytes)");
            return parser::Result::InvalidJson;
        }
        auto r = parser::helper::require_object(root);
        if (r != parser::Result::Parsed) {
            PL_WARN("[CODEC] Frame root is not an object -> dropped");
            return r;
        }
        r = parser::helper::parse_string_required(root, "type", out.type);
        if (r != parser::Result::Parsed) {
            PL_WARN("[CODEC] Frame without a string 'type' -> dropped");
            return r;
        }
        if (root["payload"].error()) {
            out.payload = "null";
        }
        else {
            r = parser::helper::parse_raw_required(root, "payload", out.payload);
            if (r != parser::Result::Parsed) {
                return r;
            }
        }
        r = parser::helper::parse_string_optional(root, "terminalId", out.terminal_id);
        if (r != parser::Result::Parsed) {
            PL_WARN("[CODEC] Frame with a non-string 'terminalId' -> dropped");
            return r;
        }
        std::optional<std::string> ts;
        r = parser::helper::parse_string_optional(root, "timestamp", ts);
        if (r != parser::Result::Parsed) {
            PL_WARN("[CODEC] Frame with a non-string 'timestamp' -> dropped");
            return r;
        }
        out.timestamp = ts ? std::move(*ts) : std::string{};
        return parser::Result::Parsed;
    }

    // Decode a payload document into a typed schema using one of the
    // parser::<name>::parse() structs.
    template<class Parser, class Schema>
    [[nodiscard]]
    inline parser::Result decode_payload(std::string_view payload, Schema& out) noexcept {
        simdjson::dom::element root;
        if (parser_.parse(payload.data(), payload.size()).get(root)) {
            return parser::Result::InvalidJson;
        }
        return Parser::parse(root, out);
    }

    // Validate caller-provided JSON and produce its minified form
    [[nodiscard]]
    inline parser::Result normalize(std::string_view json_text, std::string& out) noexcept {
        simdjson::dom::element root;
        if (parser_.parse(json_text.data(), json_text.size()).get(root)) {
            return parser::Result::InvalidJson;
        }
        out = simdjson::minify(root);
        return parser::Result::Parsed;
    }

private:
    simdjson::dom::parser parser_;
};

} // namespace poslink::core::protocol
