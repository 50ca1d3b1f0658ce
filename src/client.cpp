#include "poslink/client.hpp"

#include <thread>
#include <utility>

#include "poslink/core/protocol/codec.hpp"
#include "poslink/core/protocol/message_type.hpp"
#include "poslink/core/protocol/parser/inventory_change.hpp"
#include "poslink/core/protocol/parser/price_response.hpp"
#include "poslink/core/protocol/parser/terminal_status.hpp"
#include "poslink/core/protocol/session.hpp"
#include "poslink/core/transport/beast/websocket.hpp"
#include "poslink/core/transport/parse_url.hpp"
#include "poslink/dispatch/category.hpp"
#include "poslink/identity/file_store.hpp"
#include "poslink/identity/resolver.hpp"
#include "poslink/log/logger.hpp"
#include "poslink/status/host_facts.hpp"
#include "poslink/status/http_channel.hpp"
#include "poslink/status/reporter.hpp"

#include "simdjson.h"


namespace poslink {

using namespace core;
using protocol::parser::Result;
namespace helper = protocol::parser::helper;

namespace {

// Lifecycle payloads published by the session ({code, reason}, {attempt, delayMs}, {attempts})
struct disconnected_event {
    static Result parse(const simdjson::dom::element& root, ConnectionEvent& out) noexcept {
        double code = 0;
        auto r = helper::parse_number_required(root, "code", code);
        if (r != Result::Parsed) {
            return r;
        }
        out.code = static_cast<std::uint16_t>(code);
        return helper::parse_string_required(root, "reason", out.reason);
    }
};

struct reconnect_event {
    static Result parse(const simdjson::dom::element& root, ConnectionEvent& out) noexcept {
        double attempt = 0;
        double delay = 0;
        auto r = helper::parse_number_required(root, "attempt", attempt);
        if (r != Result::Parsed) {
            return r;
        }
        r = helper::parse_number_required(root, "delayMs", delay);
        if (r != Result::Parsed) {
            return r;
        }
        out.attempt = static_cast<int>(attempt);
        out.delay = std::chrono::milliseconds(static_cast<std::int64_t>(delay));
        return Result::Parsed;
    }
};

struct gave_up_event {
    static Result parse(const simdjson::dom::element& root, ConnectionEvent& out) noexcept {
        double attempts = 0;
        auto r = helper::parse_number_required(root, "attempts", attempts);
        if (r == Result::Parsed) {
            out.attempt = static_cast<int>(attempts);
        }
        return r;
    }
};

} // namespace


struct Client::Impl {
    using Session = protocol::Session<transport::beast::WebSocket>;
    using Reporter = status::Reporter<status::HttpChannel>;

    Config cfg;
    dispatch::Bus bus;
    host::Lifecycle lifecycle;

    identity::FileStore store;
    identity::Resolver<identity::FileStore> resolver;
    status::HostFacts facts;

    Session session;
    status::HttpChannel channel;
    Reporter reporter;

    // Decodes payloads for the typed subscriptions
    protocol::Codec codec;

    host::Lifecycle::ListenerId visibility_mirror{host::Lifecycle::INVALID_LISTENER};

    explicit Impl(Config c)
        : cfg(std::move(c))
        , store(cfg.identity_path())
        , resolver(store)
        , facts(cfg.host_facts())
        , session(bus, cfg.reconnect_policy())
        , channel(cfg.http_channel())
        , reporter(channel,
                   [this]() { return facts.snapshot(resolver.resolve()); },
                   [this]() { return facts.network_available(); },
                   std::chrono::milliseconds(cfg.status_interval_ms))
    {
        reporter.watch(bus);
        // Best effort: the socket peer learns about visibility too
        visibility_mirror = lifecycle.on_visibility([this](bool visible) {
            if (!session.is_connected()) {
                return;
            }
            const auto status = visible ? protocol::schema::ActivityStatus::Active
                                        : protocol::schema::ActivityStatus::Inactive;
            if (!session.update_terminal_status(status)) {
                PL_DEBUG("[CLIENT] terminal_status_update '" << protocol::schema::to_string(status) << "' not sent");
            }
        });
    }

    ~Impl() {
        lifecycle.detach(visibility_mirror);
    }

    template<class Parser, class Schema>
    dispatch::Subscription typed(std::string_view category, Handler<Schema> fn) {
        if (!fn) {
            return {};
        }
        const auto id = bus.subscribe(category, [this, category, fn = std::move(fn)](std::string_view payload) {
            Schema value{};
            const auto r = codec.template decode_payload<Parser>(payload, value);
            if (r != Result::Parsed) {
                PL_WARN("[CLIENT] '" << category << "' payload skipped (" << protocol::parser::to_string(r) << ")");
                return;
            }
            fn(value);
        });
        return dispatch::Subscription(bus, category, id);
    }

    dispatch::Subscription raw(std::string_view category, Handler<std::string_view> fn) {
        if (!fn) {
            return {};
        }
        const auto id = bus.subscribe(category, [fn = std::move(fn)](std::string_view payload) {
            fn(payload);
        });
        return dispatch::Subscription(bus, category, id);
    }

    template<class Parser>
    dispatch::Subscription link(std::string_view category, LinkState state, const Handler<ConnectionEvent>& fn) {
        const auto id = bus.subscribe(category, [this, category, state, fn](std::string_view payload) {
            ConnectionEvent ev;
            ev.state = state;
            const auto r = codec.template decode_payload<Parser>(payload, ev);
            if (r != Result::Parsed) {
                PL_WARN("[CLIENT] '" << category << "' event skipped (" << protocol::parser::to_string(r) << ")");
                return;
            }
            fn(ev);
        });
        return dispatch::Subscription(bus, category, id);
    }
};

namespace {

// "connected" carries no fields
struct no_fields {
    static Result parse(const simdjson::dom::element&, ConnectionEvent&) noexcept {
        return Result::Parsed;
    }
};

} // namespace


Client::Client(Config cfg)
    : impl_(std::make_unique<Impl>(std::move(cfg)))
{}

Client::~Client() {
    if (impl_) {
        impl_->reporter.stop();
        impl_->session.disconnect();
    }
}

transport::Error Client::connect() {
    return connect(impl_->cfg.endpoint);
}

transport::Error Client::connect(std::string_view url) {
    transport::ParsedUrl parsed;
    if (transport::parse_url(url, parsed) != transport::Error::None || parsed.scheme != "ws") {
        PL_ERROR("[CLIENT] Unsupported endpoint '" << url << "' (expected ws://)");
        return transport::Error::InvalidUrl;
    }
    PL_INFO("[CLIENT] Terminal " << impl_->resolver.resolve() << " connecting to " << url);
    if (impl_->cfg.status_reporting && !impl_->reporter.is_running()) {
        impl_->reporter.start(impl_->lifecycle);
    }
    return impl_->session.connect(url);
}

void Client::disconnect() {
    impl_->session.disconnect();
    impl_->reporter.stop();
}

void Client::poll() {
    impl_->session.poll();
    impl_->reporter.poll();
}

void Client::run_while(const std::function<bool()>& cond, std::chrono::milliseconds tick) {
    while (cond()) {
        poll();
        std::this_thread::sleep_for(tick);
    }
}

void Client::flush_status(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (impl_->channel.in_flight() > 0 && std::chrono::steady_clock::now() < deadline) {
        impl_->channel.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    if (impl_->channel.in_flight() > 0) {
        PL_WARN("[CLIENT] " << impl_->channel.in_flight() << " status request(s) abandoned");
    }
}

bool Client::send(std::string_view type, std::string_view payload_json) {
    return impl_->session.send(type, payload_json);
}

bool Client::request_price(std::string_view product_id, std::string_view barcode) {
    return impl_->session.request_price(product_id, barcode);
}

bool Client::report_inventory_change(std::string_view product_id, double old_quantity, double new_quantity, std::string_view reason) {
    return impl_->session.report_inventory_change(product_id, old_quantity, new_quantity, reason);
}

bool Client::sync_transaction(std::string_view record_json) {
    return impl_->session.sync_transaction(record_json);
}

bool Client::update_terminal_status(protocol::schema::ActivityStatus status) {
    return impl_->session.update_terminal_status(status);
}

dispatch::Subscription Client::on_price_response(Handler<protocol::schema::PriceResponse> fn) {
    return impl_->typed<protocol::parser::price_response>(
        protocol::to_string(protocol::MessageType::PriceResponse), std::move(fn));
}

dispatch::Subscription Client::on_inventory_changed(Handler<protocol::schema::InventoryChange> fn) {
    return impl_->typed<protocol::parser::inventory_change>(
        protocol::to_string(protocol::MessageType::InventoryChanged), std::move(fn));
}

dispatch::Subscription Client::on_terminal_status(Handler<protocol::schema::TerminalStatus> fn) {
    return impl_->typed<protocol::parser::terminal_status>(
        protocol::to_string(protocol::MessageType::TerminalStatus), std::move(fn));
}

dispatch::Subscription Client::on_transaction_sync(Handler<std::string_view> fn) {
    return impl_->raw(protocol::to_string(protocol::MessageType::TransactionSync), std::move(fn));
}

dispatch::Subscription Client::on_employee_action(Handler<std::string_view> fn) {
    return impl_->raw(protocol::to_string(protocol::MessageType::EmployeeAction), std::move(fn));
}

std::vector<dispatch::Subscription> Client::on_connection_state(Handler<ConnectionEvent> fn) {
    std::vector<dispatch::Subscription> subs;
    if (!fn) {
        return subs;
    }
    subs.reserve(4);
    subs.push_back(impl_->link<no_fields>(dispatch::category::Connected, LinkState::Connected, fn));
    subs.push_back(impl_->link<disconnected_event>(dispatch::category::Disconnected, LinkState::Disconnected, fn));
    subs.push_back(impl_->link<reconnect_event>(dispatch::category::ReconnectScheduled, LinkState::Reconnecting, fn));
    subs.push_back(impl_->link<gave_up_event>(dispatch::category::MaxReconnectAttemptsReached, LinkState::GaveUp, fn));
    return subs;
}

dispatch::Bus& Client::bus() noexcept {
    return impl_->bus;
}

host::Lifecycle& Client::lifecycle() noexcept {
    return impl_->lifecycle;
}

const std::string& Client::terminal_id() {
    return impl_->resolver.resolve();
}

std::optional<std::string> Client::session_terminal_id() const {
    return impl_->session.terminal_id();
}

bool Client::is_connected() const noexcept {
    return impl_->session.is_connected();
}

transport::State Client::state() const noexcept {
    return impl_->session.state();
}

bool Client::status_registered() const noexcept {
    return impl_->reporter.registered();
}

const Config& Client::config() const noexcept {
    return impl_->cfg;
}

} // namespace poslink
