#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "poslink/config.hpp"
#include "poslink/core/protocol/schema/inventory_change.hpp"
#include "poslink/core/protocol/schema/price_response.hpp"
#include "poslink/core/protocol/schema/terminal_status.hpp"
#include "poslink/core/protocol/schema/terminal_status_update.hpp"
#include "poslink/core/transport/error.hpp"
#include "poslink/core/transport/state.hpp"
#include "poslink/dispatch/bus.hpp"
#include "poslink/host/lifecycle.hpp"


namespace poslink {

// Connection facts as seen by application code
enum class LinkState : std::uint8_t {
    Connected,
    Disconnected,
    Reconnecting,
    GaveUp
};

[[nodiscard]]
inline constexpr std::string_view to_string(LinkState s) noexcept {
    switch (s) {
        case LinkState::Connected:    return "connected";
        case LinkState::Disconnected: return "disconnected";
        case LinkState::Reconnecting: return "reconnecting";
        case LinkState::GaveUp:       return "gave_up";
        default:                      return "unknown";
    }
}

struct ConnectionEvent {
    LinkState state{LinkState::Disconnected};
    std::uint16_t code{0};                  // Disconnected
    std::string reason;                     // Disconnected
    int attempt{0};                         // Reconnecting, GaveUp
    std::chrono::milliseconds delay{0};     // Reconnecting
};


/*
===============================================================================
 poslink::Client
===============================================================================

One terminal's real-time link, ready to use:

  identity::Resolver (FileStore)  → stable terminal identity
  protocol::Session (Beast)       → socket, reconnection, envelope codec
  dispatch::Bus                   → inbound fan-out
  status::Reporter (HTTP)         → registration and periodic status
  host::Lifecycle                 → visibility / teardown signals

Everything runs on the thread that calls poll(). Typed subscriptions decode
the payload before calling user code; payloads that do not match the
expected shape are logged and skipped.

Subscriptions returned by the on_*() helpers must not outlive the client.
===============================================================================
*/

class Client {
public:
    template<class T>
    using Handler = std::function<void(const T&)>;

    explicit Client(Config cfg = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Connect to the configured endpoint (or to url). Also starts status
    // reporting when enabled. wss:// is not supported.
    [[nodiscard]]
    core::transport::Error connect();

    [[nodiscard]]
    core::transport::Error connect(std::string_view url);

    // Clean close: no reconnection, status reporting stopped
    void disconnect();

    void poll();

    // Poll until cond() turns false, sleeping tick between iterations
    void run_while(const std::function<bool()>& cond,
                   std::chrono::milliseconds tick = std::chrono::milliseconds(1));

    // Keep polling until pending status requests complete or timeout expires
    void flush_status(std::chrono::milliseconds timeout);

    // --- Outbound ------------------------------------------------------------

    [[nodiscard]]
    bool send(std::string_view type, std::string_view payload_json);

    [[nodiscard]]
    bool request_price(std::string_view product_id, std::string_view barcode);

    [[nodiscard]]
    bool report_inventory_change(std::string_view product_id, double old_quantity, double new_quantity, std::string_view reason);

    [[nodiscard]]
    bool sync_transaction(std::string_view record_json);

    [[nodiscard]]
    bool update_terminal_status(core::protocol::schema::ActivityStatus status);

    // --- Typed subscriptions -------------------------------------------------

    [[nodiscard]]
    dispatch::Subscription on_price_response(Handler<core::protocol::schema::PriceResponse> fn);

    [[nodiscard]]
    dispatch::Subscription on_inventory_changed(Handler<core::protocol::schema::InventoryChange> fn);

    [[nodiscard]]
    dispatch::Subscription on_terminal_status(Handler<core::protocol::schema::TerminalStatus> fn);

    // Raw (minified) JSON payload
    [[nodiscard]]
    dispatch::Subscription on_transaction_sync(Handler<std::string_view> fn);

    [[nodiscard]]
    dispatch::Subscription on_employee_action(Handler<std::string_view> fn);

    // One handle per lifecycle category
    [[nodiscard]]
    std::vector<dispatch::Subscription> on_connection_state(Handler<ConnectionEvent> fn);

    // --- Accessors -----------------------------------------------------------

    [[nodiscard]]
    dispatch::Bus& bus() noexcept;

    [[nodiscard]]
    host::Lifecycle& lifecycle() noexcept;

    // Stable identity of this terminal (loaded or generated on first use)
    [[nodiscard]]
    const std::string& terminal_id();

    // Id assigned by the server for the current connection, if any
    [[nodiscard]]
    std::optional<std::string> session_terminal_id() const;

    [[nodiscard]]
    bool is_connected() const noexcept;

    [[nodiscard]]
    core::transport::State state() const noexcept;

    [[nodiscard]]
    bool status_registered() const noexcept;

    [[nodiscard]]
    const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace poslink
