#pragma once

#include <cstdint>
#include <string_view>

namespace poslink::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Boost.Beast, Asio, OS errno).

Higher layers (transport::Connection, protocol::Session) use this
classification for logging and lifecycle events. Reconnection decisions are
driven by the close code, not by this enum.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current connection state

    // --- Expected / benign termination --------------------------------------
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Connect, handshake or I/O timeout
    ConnectionFailed, // DNS, TCP connect, routing
    HandshakeFailed,  // WebSocket upgrade refused or malformed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation from the peer

    // --- Unspecified transport failure --------------------------------------
    TransportFailure,
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

// True for failures that leave the connection worth another attempt.
// Caller misuse (bad URL, wrong state) is never retried.
[[nodiscard]]
inline constexpr bool is_retryable(Error err) noexcept {
    switch (err) {
    case Error::None:
    case Error::InvalidUrl:
    case Error::InvalidState:
        return false;
    default:
        return true;
    }
}


/*
===============================================================================
 transport::CloseCode
===============================================================================

WebSocket close status codes (RFC 6455, section 7.4.1).

Only CloseCode::Normal is a clean, caller-intended closure. Every other code,
including an abrupt drop reported as CloseCode::Abnormal, triggers the
reconnection policy.
===============================================================================
*/

enum class CloseCode : std::uint16_t {
    Normal          = 1000,
    GoingAway       = 1001,
    ProtocolError   = 1002,
    Unsupported     = 1003,
    NoStatus        = 1005,
    Abnormal        = 1006,
    InvalidPayload  = 1007,
    PolicyViolation = 1008,
    TooBig          = 1009,
    InternalError   = 1011,
    ServiceRestart  = 1012,
    TryAgainLater   = 1013,
};

[[nodiscard]]
inline constexpr std::uint16_t to_value(CloseCode code) noexcept {
    return static_cast<std::uint16_t>(code);
}

[[nodiscard]]
inline constexpr bool is_clean(CloseCode code) noexcept {
    return code == CloseCode::Normal;
}

inline constexpr std::string_view to_string(CloseCode code) noexcept {
    switch (code) {
    case CloseCode::Normal:          return "Normal";
    case CloseCode::GoingAway:       return "GoingAway";
    case CloseCode::ProtocolError:   return "ProtocolError";
    case CloseCode::Unsupported:     return "Unsupported";
    case CloseCode::NoStatus:        return "NoStatus";
    case CloseCode::Abnormal:        return "Abnormal";
    case CloseCode::InvalidPayload:  return "InvalidPayload";
    case CloseCode::PolicyViolation: return "PolicyViolation";
    case CloseCode::TooBig:          return "TooBig";
    case CloseCode::InternalError:   return "InternalError";
    case CloseCode::ServiceRestart:  return "ServiceRestart";
    case CloseCode::TryAgainLater:   return "TryAgainLater";
    default:                         return "Other";
    }
}

} // namespace transport
} // namespace poslink::core
