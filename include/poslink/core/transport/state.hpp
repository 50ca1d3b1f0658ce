#pragma once

#include <cstdint>
#include <string_view>


namespace poslink::core::transport {

// ===============================================================
// CONNECTION STATE ENUM
// ===============================================================
// The only observable states of a logical connection. A pending
// reconnect timer is tracked separately and never shows up here:
// while waiting for it the connection reads as Disconnected.
enum class State : uint8_t {
    Disconnected,
    Connecting,
    Connected
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected: return "Disconnected";
        case State::Connecting:   return "Connecting";
        case State::Connected:    return "Connected";
        default:                  return "Unknown";
    }
}


// ===============================================================
// EVENT ENUM
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    OpenRequested,
    CloseRequested,

    // --- Transport lifecycle ---
    TransportOpened,
    TransportOpenFailed,
    TransportClosed,

    // --- Retry ---
    RetryTimerExpired
};

[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::OpenRequested:       return "OpenRequested";
        case Event::CloseRequested:      return "CloseRequested";
        case Event::TransportOpened:     return "TransportOpened";
        case Event::TransportOpenFailed: return "TransportOpenFailed";
        case Event::TransportClosed:     return "TransportClosed";
        case Event::RetryTimerExpired:   return "RetryTimerExpired";
        default:                         return "UnknownEvent";
    }
}


// ===============================================================
// DISCONNECT REASON ENUM
// ===============================================================
enum class DisconnectReason : uint8_t {
    None,
    LocalClose,        // explicit close() by user
    RemoteClose,       // close frame from the server
    TransportError     // socket / IO error, abrupt drop
};

[[nodiscard]]
inline constexpr std::string_view to_string(DisconnectReason r) noexcept {
    switch (r) {
        case DisconnectReason::None:           return "None";
        case DisconnectReason::LocalClose:     return "LocalClose";
        case DisconnectReason::RemoteClose:    return "RemoteClose";
        case DisconnectReason::TransportError: return "TransportError";
        default:                               return "Unknown";
    }
}

} // namespace poslink::core::transport
