#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "poslink/core/protocol/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helper functions used by the payload parsers to extract primitive
JSON values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (bool, number, string, raw sub-document)
  • Provide strict optional-field handling semantics

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions
  - An optional field that is present but `null` counts as absent

================================================================================
*/


namespace poslink::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return root.is_object() ? Result::Parsed : Result::InvalidSchema;
}

// ============================================================================
// STRINGS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (obj[key].get(sv)) {
        return Result::InvalidSchema; // missing or wrong type
    }
    out.assign(sv.data(), sv.size());
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.value_unsafe().is_null()) {
        return Result::Parsed; // optional, not present
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out.emplace(sv);
    return Result::Parsed;
}

// Accepts a JSON string, or a number rendered back to its textual form
// (identifiers such as productId travel either way).
[[nodiscard]]
inline Result parse_id_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    simdjson::dom::element el = field.value_unsafe();
    std::string_view sv;
    if (!el.get(sv)) {
        out.assign(sv.data(), sv.size());
        return Result::Parsed;
    }
    if (el.is_int64() || el.is_uint64()) {
        out = simdjson::minify(el);
        return Result::Parsed;
    }
    return Result::InvalidSchema;
}

// ============================================================================
// SCALARS
// ============================================================================

[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (obj[key].get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// Any JSON number (integer or floating point)
[[nodiscard]]
inline Result parse_number_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || !field.value_unsafe().is_number()) {
        return Result::InvalidSchema;
    }
    if (field.get_double().get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// RAW SUB-DOCUMENTS
// ============================================================================

// Minified JSON text of any field value
[[nodiscard]]
inline Result parse_raw_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    out = simdjson::minify(field.value_unsafe());
    return Result::Parsed;
}

} // namespace poslink::core::protocol::parser::helper
