#pragma once

#include <cstdint>
#include <string_view>


namespace poslink::core::protocol::parser {

// ===============================================
// PARSER RESULT ENUM
// ===============================================
enum class Result : std::uint8_t {
    InvalidJson    = 0,            // Structural failure
    InvalidSchema  = 1,            // Missing required field, type mismatch, etc.
    InvalidValue   = 2,            // Field present but semantically invalid
    Parsed         = 3,            // Parsed successfully
};

// -----------------------------------------------------------------------------
// Convert enum → string (for logging / diagnostics)
// -----------------------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::InvalidJson:    return "InvalidJson";
        case Result::InvalidSchema:  return "InvalidSchema";
        case Result::InvalidValue:   return "InvalidValue";
        case Result::Parsed:         return "Parsed";
        default:                     return "unknown";
    }
}

} // namespace poslink::core::protocol::parser
