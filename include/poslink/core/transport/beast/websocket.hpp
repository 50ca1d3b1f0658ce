#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "poslink/core/transport/error.hpp"
#include "poslink/core/transport/websocket/events.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast, poll-driven)
================================================================================

Implements transport::WebSocketConcept on top of Boost.Beast, keeping a strict
separation between *transport mechanics* and *connection policy*:

  • Single-connection transport primitive - no retries, no reconnection logic
  • Owns a private io_context that only advances inside poll(), so every
    completion handler runs on the caller's thread
  • Resolve, TCP connect, upgrade handshake, reads and writes are all
    asynchronous; connect() returns as soon as the attempt is in flight
  • OPEN_TIMEOUT bounds the whole opening phase, DNS resolution included
  • Failure-first signaling - Error followed by exactly one Close
  • Idempotent close()

Plain ws:// only. TLS is not linked into this transport; Connection refuses
wss:// URLs before an instance is ever created.
================================================================================
*/

namespace poslink::core {
namespace transport {
namespace beast {

// Budget for resolve + TCP connect + upgrade handshake
inline constexpr auto OPEN_TIMEOUT = std::chrono::seconds(10);

class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept;

    [[nodiscard]]
    bool send(std::string_view text) noexcept;

    void close(CloseCode code, std::string_view reason) noexcept;

    void poll() noexcept;

    [[nodiscard]]
    bool poll_event(websocket::Event& out) noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace beast
} // namespace transport
} // namespace poslink::core
