#include "poslink/core/transport/beast/websocket.hpp"

#include <deque>
#include <exception>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "poslink/log/logger.hpp"
#include "poslink/version.hpp"


namespace poslink::core {
namespace transport {
namespace beast {

namespace asio = boost::asio;
namespace bws = boost::beast::websocket;
using tcp = asio::ip::tcp;
using boost::beast::error_code;

// Close reason payload limit (RFC 6455: 125 byte control frame, 2 bytes of code)
constexpr std::size_t MAX_CLOSE_REASON = 123;

struct WebSocket::Impl {
    enum class Phase { Idle, Opening, Open, Closing, Closed };

    // Declared first: destroyed last, after every I/O object bound to it
    asio::io_context ioc;
    tcp::resolver resolver{ioc};
    bws::stream<boost::beast::tcp_stream> ws{ioc};
    asio::steady_timer open_deadline{ioc};
    boost::beast::flat_buffer buffer;

    Phase phase{Phase::Idle};
    std::string host_header;
    std::string path;

    std::deque<std::string> outbox;
    bool writing{false};

    std::uint16_t close_code{0};
    std::string close_reason;

    std::deque<websocket::Event> events;

    void fail(Error err, std::string_view what, const error_code& ec) {
        if (phase == Phase::Closed) {
            return;
        }
        PL_WARN("[WS] " << what << " failed: " << ec.message());
        events.push_back(websocket::Event::make_error(err));
        finish(to_value(CloseCode::Abnormal), ec.message());
    }

    // Emits the single Close of this transport instance
    void finish(std::uint16_t code, std::string reason) {
        if (phase == Phase::Closed) {
            return;
        }
        phase = Phase::Closed;
        events.push_back(websocket::Event::make_close(code, std::move(reason)));
        open_deadline.cancel();
        resolver.cancel();
        error_code ignored;
        boost::beast::get_lowest_layer(ws).socket().close(ignored);
    }

    // Bounds resolve, TCP connect and the upgrade handshake together
    void arm_open_deadline() {
        open_deadline.expires_after(OPEN_TIMEOUT);
        open_deadline.async_wait([this](const error_code& ec) {
            if (ec || phase != Phase::Opening) {
                return;
            }
            fail(Error::Timeout, "open", boost::beast::error::timeout);
        });
    }

    void on_resolve(const error_code& ec, const tcp::resolver::results_type& results) {
        if (phase != Phase::Opening) return;
        if (ec) {
            fail(Error::ConnectionFailed, "resolve", ec);
            return;
        }
        boost::beast::get_lowest_layer(ws).async_connect(results,
            [this](const error_code& ec2, const tcp::endpoint& ep) { on_connect(ec2, ep); });
    }

    void on_connect(const error_code& ec, const tcp::endpoint& ep) {
        if (phase != Phase::Opening) return;
        if (ec) {
            fail(ec == boost::beast::error::timeout ? Error::Timeout : Error::ConnectionFailed, "connect", ec);
            return;
        }
        PL_DEBUG("[WS] TCP connected to " << ep.address().to_string() << ":" << ep.port());
        // Past the handshake the websocket stream applies its own idle timeouts
        ws.set_option(bws::stream_base::timeout::suggested(boost::beast::role_type::client));
        ws.set_option(bws::stream_base::decorator([](bws::request_type& req) {
            req.set(boost::beast::http::field::user_agent, std::string("poslink/") + PL_VERSION_STRING);
        }));
        ws.async_handshake(host_header, path,
            [this](const error_code& ec2) { on_handshake(ec2); });
    }

    void on_handshake(const error_code& ec) {
        if (phase != Phase::Opening) return;
        if (ec) {
            fail(ec == boost::beast::error::timeout ? Error::Timeout : Error::HandshakeFailed, "handshake", ec);
            return;
        }
        phase = Phase::Open;
        open_deadline.cancel();
        ws.text(true);
        events.push_back(websocket::Event::make_open());
        do_read();
    }

    void do_read() {
        ws.async_read(buffer,
            [this](const error_code& ec, std::size_t) { on_read(ec); });
    }

    void on_read(const error_code& ec) {
        if (phase == Phase::Closed) return;
        if (ec == bws::error::closed) {
            // Remote close frame completed the closing handshake
            const auto& reason = ws.reason();
            finish(static_cast<std::uint16_t>(reason.code), std::string(reason.reason.c_str()));
            return;
        }
        if (ec) {
            if (phase == Phase::Closing) {
                return; // local close in progress, on_close resolves it
            }
            const bool remote = (ec == asio::error::eof || ec == asio::error::connection_reset);
            const bool violation = (ec == bws::condition::protocol_violation);
            fail(remote ? Error::RemoteClosed : violation ? Error::ProtocolError : Error::TransportFailure, "read", ec);
            return;
        }
        events.push_back(websocket::Event::make_message(boost::beast::buffers_to_string(buffer.data())));
        buffer.consume(buffer.size());
        do_read();
    }

    void do_write() {
        writing = true;
        ws.async_write(asio::buffer(outbox.front()),
            [this](const error_code& ec, std::size_t) { on_write(ec); });
    }

    void on_write(const error_code& ec) {
        writing = false;
        if (phase == Phase::Closed) return;
        if (ec) {
            fail(Error::TransportFailure, "write", ec);
            return;
        }
        outbox.pop_front();
        if (!outbox.empty() && phase == Phase::Open) {
            do_write();
        }
    }

    void on_close(const error_code& ec) {
        if (ec) {
            PL_DEBUG("[WS] Closing handshake ended with: " << ec.message());
        }
        finish(close_code, close_reason);
    }
};


WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>())
{}

WebSocket::~WebSocket() = default;

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& path) noexcept {
    Impl& s = *impl_;
    if (s.phase != Impl::Phase::Idle) {
        return Error::InvalidState;
    }
    s.host_header = host + ":" + port;
    s.path = path;
    s.phase = Impl::Phase::Opening;
    PL_DEBUG("[WS] Opening ws://" << s.host_header << s.path);
    try {
        s.arm_open_deadline();
        s.resolver.async_resolve(host, port,
            [&s](const error_code& ec, const tcp::resolver::results_type& results) { s.on_resolve(ec, results); });
    }
    catch (const std::exception& e) {
        PL_ERROR("[WS] Unable to start connection attempt: " << e.what());
        s.phase = Impl::Phase::Closed;
        return Error::ConnectionFailed;
    }
    return Error::None;
}

bool WebSocket::send(std::string_view text) noexcept {
    Impl& s = *impl_;
    if (s.phase != Impl::Phase::Open) {
        return false;
    }
    s.outbox.emplace_back(text);
    if (!s.writing) {
        s.do_write();
    }
    return true;
}

void WebSocket::close(CloseCode code, std::string_view reason) noexcept {
    Impl& s = *impl_;
    s.close_code = to_value(code);
    s.close_reason = std::string(reason.substr(0, MAX_CLOSE_REASON));
    switch (s.phase) {
        case Impl::Phase::Open:
            // Frames already queued stay alive until their write completes
            s.phase = Impl::Phase::Closing;
            s.ws.async_close(bws::close_reason(static_cast<bws::close_code>(s.close_code), s.close_reason),
                [&s](const error_code& ec) { s.on_close(ec); });
            break;

        case Impl::Phase::Idle:
        case Impl::Phase::Opening:
            // Nothing to negotiate with the peer yet: abort in place
            s.finish(s.close_code, s.close_reason);
            break;

        case Impl::Phase::Closing:
        case Impl::Phase::Closed:
            break; // idempotent
    }
}

void WebSocket::poll() noexcept {
    Impl& s = *impl_;
    try {
        // poll() leaves the context stopped once it runs out of ready work
        if (s.ioc.stopped()) {
            s.ioc.restart();
        }
        s.ioc.poll();
    }
    catch (const std::exception& e) {
        PL_ERROR("[WS] I/O loop failure: " << e.what());
        s.events.push_back(websocket::Event::make_error(Error::TransportFailure));
        s.finish(to_value(CloseCode::Abnormal), e.what());
    }
}

bool WebSocket::poll_event(websocket::Event& out) noexcept {
    Impl& s = *impl_;
    if (s.events.empty()) {
        return false;
    }
    out = std::move(s.events.front());
    s.events.pop_front();
    return true;
}

} // namespace beast
} // namespace transport
} // namespace poslink::core
