#pragma once

/*
===============================================================================
 poslink::core::transport::websocket::Event
===============================================================================

Event emitted by a WebSocket transport implementation and drained by the
owning Connection via poll_event().

Every handler of the transport runs on the thread that calls poll(), so the
events are produced and consumed on the same loop. They are delivered in the
order the transport observed them:

    • Open     → Upgrade handshake completed, the socket is usable
    • Message  → One complete inbound text frame (data = frame text)
    • Error    → Transport-level failure (informational)
    • Close    → Transport closed (code + reason in data)

Reliability contract:
    • Exactly one Close is emitted per transport instance, whether the open
      handshake failed or an established socket went down.
    • An Error is always followed by a Close.
    • Abrupt drops without a close frame report CloseCode::Abnormal.
===============================================================================
*/

#include <cstdint>
#include <string>
#include <utility>

#include "poslink/core/transport/error.hpp"

namespace poslink::core::transport::websocket {

enum class EventType : std::uint8_t {
    Open = 0,
    Message = 1,
    Error = 2,
    Close = 3,
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::Open:    return "Open";
        case EventType::Message: return "Message";
        case EventType::Error:   return "Error";
        case EventType::Close:   return "Close";
        default:                 return "Unknown";
    }
}

struct Event {
    EventType type{EventType::Close};
    transport::Error error{transport::Error::None}; // valid only if type == Error
    std::uint16_t code{0};                          // valid only if type == Close
    std::string data;                               // frame text (Message) or close reason (Close)

    static Event make_open() {
        Event ev;
        ev.type = EventType::Open;
        return ev;
    }

    static Event make_message(std::string text) {
        Event ev;
        ev.type = EventType::Message;
        ev.data = std::move(text);
        return ev;
    }

    static Event make_error(transport::Error e) {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }

    static Event make_close(std::uint16_t code, std::string reason = {}) {
        Event ev;
        ev.type = EventType::Close;
        ev.code = code;
        ev.data = std::move(reason);
        return ev;
    }

    static Event make_close(CloseCode code, std::string reason = {}) {
        return make_close(to_value(code), std::move(reason));
    }
};

} // namespace poslink::core::transport::websocket
