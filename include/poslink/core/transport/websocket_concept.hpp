/*
===============================================================================
WebSocketConcept (Poll-Driven)
===============================================================================

Defines the minimal transport contract required by Connection.

The WebSocket implementation:

  • Is default constructible; Connection creates a fresh instance per attempt
  • Starts the open handshake in connect() and completes it asynchronously
  • Performs I/O only inside poll(), on the caller's thread
  • Reports everything that happened through poll_event(), in order
  • Is fully lifecycle-managed by Connection

No callbacks.
No background threads.
No dynamic dispatch.

-------------------------------------------------------------------------------
Contract
-------------------------------------------------------------------------------

connect(host, port, path)
    Begins an asynchronous open. Error::None means the attempt is in flight
    and will end in exactly one Open or Close event. Any other value means
    the attempt could not even be started; no events follow.

send(text)
    Queues one text frame. Returns false if the socket is not open.

close(code, reason)
    Starts the closing handshake. Idempotent.

===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "poslink/core/transport/error.hpp"
#include "poslink/core/transport/websocket/events.hpp"


namespace poslink::core::transport {

template<class WS>
concept WebSocketConcept =
    std::default_initializable<WS> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        std::string_view msg,
        CloseCode code,
        std::string_view reason,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(host, port, path) } noexcept -> std::same_as<Error>;
    { ws.close(code, reason) } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Progress
    // ---------------------------------------------------------------------

    { ws.poll() } noexcept -> std::same_as<void>;
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace poslink::core::transport
