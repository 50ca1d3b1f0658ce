/*
===============================================================================
 Connection Signals
===============================================================================

connection::Signal represents **externally observable, edge-triggered facts**
emitted by transport::Connection via its poll_signal() interface.

Signals are:
  - Edge-triggered (not level- or state-based)
  - Single-shot per occurrence
  - Delivered in the order they happened, inbound frames included
  - Poll-driven and callback-free

The Connection does NOT expose its retry bookkeeping or transport internals.
Only externally meaningful facts are surfaced.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  The WebSocket handshake completed. Retry bookkeeping has been reset.

Disconnected
  The logical connection became unusable. Carries the close code and reason.
  Emitted for failed opens as well as for drops of an established socket.

MessageReceived
  One complete inbound text frame (text).

RetryScheduled
  A reconnection attempt has been armed (attempt, delay).

RetryExhausted
  The attempt cap was reached. No further automatic attempt will occur until
  the owner opens the connection again. Emitted once per outage.

Error
  A transport-level failure was observed. Informational only; the state
  machine is driven by the Disconnected that follows.

===============================================================================
*/


#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "poslink/core/transport/error.hpp"


namespace poslink::core::transport::connection {

enum class SignalKind : std::uint8_t {
    None,
    Connected,
    Disconnected,
    MessageReceived,
    RetryScheduled,
    RetryExhausted,
    Error,
};

[[nodiscard]]
inline constexpr std::string_view to_string(SignalKind kind) noexcept {
    switch (kind) {
        case SignalKind::None:            return "None";
        case SignalKind::Connected:       return "Connected";
        case SignalKind::Disconnected:    return "Disconnected";
        case SignalKind::MessageReceived: return "MessageReceived";
        case SignalKind::RetryScheduled:  return "RetryScheduled";
        case SignalKind::RetryExhausted:  return "RetryExhausted";
        case SignalKind::Error:           return "Error";
        default:                          return "Unknown";
    }
}

struct Signal {
    SignalKind kind{SignalKind::None};
    std::uint16_t code{0};                  // Disconnected
    std::string text;                       // close reason (Disconnected) or frame (MessageReceived)
    int attempt{0};                         // RetryScheduled, RetryExhausted
    std::chrono::milliseconds delay{0};     // RetryScheduled
    transport::Error error{transport::Error::None}; // Error

    static Signal connected() {
        return Signal{SignalKind::Connected};
    }

    static Signal disconnected(std::uint16_t code, std::string reason) {
        Signal sig{SignalKind::Disconnected};
        sig.code = code;
        sig.text = std::move(reason);
        return sig;
    }

    static Signal message(std::string text) {
        Signal sig{SignalKind::MessageReceived};
        sig.text = std::move(text);
        return sig;
    }

    static Signal retry_scheduled(int attempt, std::chrono::milliseconds delay) {
        Signal sig{SignalKind::RetryScheduled};
        sig.attempt = attempt;
        sig.delay = delay;
        return sig;
    }

    static Signal retry_exhausted(int attempts) {
        Signal sig{SignalKind::RetryExhausted};
        sig.attempt = attempts;
        return sig;
    }

    static Signal failure(transport::Error e) {
        Signal sig{SignalKind::Error};
        sig.error = e;
        return sig;
    }
};

[[nodiscard]]
inline std::string_view to_string(const Signal& sig) noexcept {
    return to_string(sig.kind);
}

} // namespace poslink::core::transport::connection
