/*
===============================================================================
 Terminal protocol Session
===============================================================================

The session speaks the terminal wire protocol on top of the generic
transport::Connection and publishes everything it learns on a dispatch::Bus.

Architecture:
  - transport::*            → WebSocket transport (Boost.Beast, mockable)
  - transport::Connection   → connection lifecycle, reconnection, backoff
  - protocol::Codec         → envelope encoding / decoding
  - dispatch::Bus           → fan-out to application subscribers (not owned)

The session:
  - Owns a transport::Connection instance via composition
  - Stamps outbound envelopes with the session-bound terminal id and the
    current UTC time
  - Binds the server-assigned terminal id on connection_ack and forgets it
    whenever the connection goes down
  - Publishes decoded payloads under their message type, unknown types under
    "unknown_message", and lifecycle facts under the lifecycle categories
  - Drops malformed frames (logged) without touching the connection
  - Never throws out of poll()

Outbound sends are at-most-once: while not Connected every send returns false
and nothing is queued.
===============================================================================
*/

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "poslink/core/clock.hpp"
#include "poslink/core/timestamp.hpp"
#include "poslink/core/transport/connection.hpp"
#include "poslink/core/protocol/codec.hpp"
#include "poslink/core/protocol/message.hpp"
#include "poslink/core/protocol/message_type.hpp"
#include "poslink/core/protocol/parser/connection_ack.hpp"
#include "poslink/core/protocol/schema/price_request.hpp"
#include "poslink/core/protocol/schema/inventory_change.hpp"
#include "poslink/core/protocol/schema/terminal_status_update.hpp"
#include "poslink/dispatch/bus.hpp"
#include "poslink/dispatch/category.hpp"
#include "poslink/json/writer.hpp"
#include "poslink/log/logger.hpp"


namespace poslink::core::protocol {

template<
    transport::WebSocketConcept WS,
    core::ClockConcept Clock = std::chrono::steady_clock
>
class Session {
public:
    explicit Session(dispatch::Bus& bus, transport::ReconnectPolicy policy = {}) noexcept
        : bus_(bus)
        , connection_(policy)
    {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Open the connection. Failures that leave a retry scheduled are also
    // reported here; the retry proceeds on later polls.
    [[nodiscard]]
    inline transport::Error connect(std::string_view url) {
        const auto err = connection_.open(url);
        drain_signals_();
        return err;
    }

    // Clean close (1000): cancels any pending retry and forgets the session id
    inline void disconnect() {
        connection_.close(transport::CloseCode::Normal, "Client disconnect");
        terminal_id_.reset();
        drain_signals_();
    }

    inline void poll() {
        connection_.poll();
        drain_signals_();
    }

    // Send an application message. payload_json must be a valid JSON document.
    [[nodiscard]]
    inline bool send(std::string_view type, std::string_view payload_json) {
        if (!connection_.is_connected()) {
            PL_WARN("[SESSION] Not connected, message '" << type << "' dropped.");
            return false;
        }
        std::string payload;
        const auto r = codec_.normalize(payload_json, payload);
        if (r != parser::Result::Parsed) {
            PL_ERROR("[SESSION] Payload for '" << type << "' is not valid JSON (" << parser::to_string(r) << ")");
            return false;
        }
        return send_payload_(type, std::move(payload));
    }

    // --- Typed outbound helpers -------------------------------------------

    [[nodiscard]]
    inline bool request_price(std::string_view product_id, std::string_view barcode) {
        schema::PriceRequest req{std::string(product_id), std::string(barcode)};
        std::string payload;
        req.write_json(payload);
        return send_payload_(outbound::PriceRequest, std::move(payload));
    }

    [[nodiscard]]
    inline bool report_inventory_change(std::string_view product_id, double old_quantity, double new_quantity, std::string_view reason) {
        schema::InventoryChange change{std::string(product_id), old_quantity, new_quantity, std::string(reason)};
        std::string payload;
        change.write_json(payload);
        return send_payload_(outbound::InventoryChange, std::move(payload));
    }

    [[nodiscard]]
    inline bool sync_transaction(std::string_view record_json) {
        return send(outbound::TransactionSync, record_json);
    }

    [[nodiscard]]
    inline bool update_terminal_status(schema::ActivityStatus status) {
        schema::TerminalStatusUpdate update{status};
        std::string payload;
        update.write_json(payload);
        return send_payload_(outbound::TerminalStatusUpdate, std::move(payload));
    }

    // --- Accessors ----------------------------------------------------------

    [[nodiscard]]
    inline transport::State state() const noexcept {
        return connection_.state();
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return connection_.is_connected();
    }

    // Server-assigned id of the current session (empty until connection_ack)
    [[nodiscard]]
    inline const std::optional<std::string>& terminal_id() const noexcept {
        return terminal_id_;
    }

    [[nodiscard]]
    inline dispatch::Bus& bus() noexcept {
        return bus_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return connection_.rx_messages();
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return connection_.tx_messages();
    }

#ifdef PL_UNIT_TEST
public:
    transport::Connection<WS, Clock>& connection() {
        return connection_;
    }
#endif // PL_UNIT_TEST

private:
    dispatch::Bus& bus_;
    transport::Connection<WS, Clock> connection_;
    Codec codec_;
    std::optional<std::string> terminal_id_;

private:
    inline bool send_payload_(std::string_view type, std::string payload) {
        if (!connection_.is_connected()) {
            PL_WARN("[SESSION] Not connected, message '" << type << "' dropped.");
            return false;
        }
        Message msg;
        msg.type = std::string(type);
        msg.payload = std::move(payload);
        msg.terminal_id = terminal_id_;
        msg.timestamp = to_iso8601(now_utc());
        PL_TRACE("[SESSION] -> " << msg.type);
        return connection_.send(codec_.encode(msg));
    }

    inline void drain_signals_() {
        transport::connection::Signal sig;
        while (connection_.poll_signal(sig)) {
            handle_connection_signal_(sig);
        }
    }

    inline void handle_connection_signal_(transport::connection::Signal& sig) {
        using transport::connection::SignalKind;
        switch (sig.kind) {
        case SignalKind::Connected:
            bus_.publish(dispatch::category::Connected, "{}");
            break;

        case SignalKind::Disconnected: {
            terminal_id_.reset();
            std::string payload{"{"};
            json::append_key(payload, "code");
            json::append(payload, static_cast<std::uint64_t>(sig.code));
            payload += ',';
            json::append_key(payload, "reason");
            json::append_string(payload, sig.text);
            payload += '}';
            bus_.publish(dispatch::category::Disconnected, payload);
            break;
        }

        case SignalKind::MessageReceived:
            handle_frame_(sig.text);
            break;

        case SignalKind::RetryScheduled: {
            std::string payload{"{"};
            json::append_key(payload, "attempt");
            json::append(payload, sig.attempt);
            payload += ',';
            json::append_key(payload, "delayMs");
            json::append(payload, static_cast<std::int64_t>(sig.delay.count()));
            payload += '}';
            bus_.publish(dispatch::category::ReconnectScheduled, payload);
            break;
        }

        case SignalKind::RetryExhausted: {
            std::string payload{"{"};
            json::append_key(payload, "attempts");
            json::append(payload, sig.attempt);
            payload += '}';
            bus_.publish(dispatch::category::MaxReconnectAttemptsReached, payload);
            break;
        }

        case SignalKind::Error: {
            std::string payload{"{"};
            json::append_key(payload, "error");
            json::append_string(payload, transport::to_string(sig.error));
            payload += '}';
            bus_.publish(dispatch::category::Error, payload);
            break;
        }

        default:
            break;
        }
    }

    inline void handle_frame_(std::string_view frame) {
        Message msg;
        const auto r = codec_.decode(frame, msg);
        if (r != parser::Result::Parsed) {
            PL_WARN("[SESSION] Inbound frame dropped (" << parser::to_string(r) << ")");
            return;
        }
        PL_TRACE("[SESSION] <- " << msg.type);

        const MessageType type = message_type_from_string(msg.type);
        switch (type) {
        case MessageType::ConnectionAck: {
            schema::ConnectionAck ack;
            if (codec_.template decode_payload<parser::connection_ack>(msg.payload, ack) != parser::Result::Parsed) {
                PL_WARN("[SESSION] Invalid connection_ack payload dropped: " << msg.payload);
                return;
            }
            terminal_id_ = ack.terminal_id;
            PL_INFO("[SESSION] Terminal ID assigned: " << *terminal_id_);
            bus_.publish(dispatch::category::TerminalAssigned, msg.payload);
            break;
        }

        case MessageType::Unknown:
            PL_DEBUG("[SESSION] Unknown message type '" << msg.type << "'");
            bus_.publish(dispatch::category::UnknownMessage, codec_.encode(msg));
            break;

        default:
            bus_.publish(to_string(type), msg.payload);
            break;
        }
    }
};

} // namespace poslink::core::protocol
