#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "poslink/core/clock.hpp"
#include "poslink/core/transport/websocket_concept.hpp"
#include "poslink/core/transport/parse_url.hpp"
#include "poslink/core/transport/state.hpp"
#include "poslink/core/transport/connection/config.hpp"
#include "poslink/core/transport/connection/signal.hpp"
#include "poslink/core/transport/websocket/events.hpp"
#include "poslink/log/logger.hpp"


namespace poslink::core::transport {

/*
===============================================================================
 poslink::core::transport::Connection
===============================================================================

Generic transport-level connection abstraction, parameterized by a WebSocket
transport implementation conforming to transport::WebSocketConcept and by a
clock (std::chrono::steady_clock unless a test injects its own).

A Connection represents a *logical* connection to the server whose identity
remains stable across transient transport failures and automatic
reconnections. It knows nothing about the message format carried on top.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Own exactly one WebSocket transport at a time
- Drive the Disconnected / Connecting / Connected state machine
- Apply the reconnection policy (exponential backoff, attempt cap)
- Expose observable consequences via edge-triggered connection::Signal

-------------------------------------------------------------------------------
 Reconnection Semantics
-------------------------------------------------------------------------------
- Any close other than CloseCode::Normal schedules a reconnection attempt,
  whether the socket was established or still opening
- delay(n) = base_delay * 2^(n - 1); the attempt counter is incremented
  before the delay is computed
- After max_attempts consecutive failures RetryExhausted is emitted once and
  the connection stays Disconnected until open() is called again
- A successful open resets the attempt counter and the backoff

-------------------------------------------------------------------------------
 Epoch Guard
-------------------------------------------------------------------------------
Every open() and close() increments the epoch. A pending retry remembers the
epoch it was armed in and is discarded when it fires under a different one,
so a timer armed before an explicit close() can never revive the connection.

-------------------------------------------------------------------------------
 Usage Model
-------------------------------------------------------------------------------
- Call open(url) once to activate the connection
- Drive all progress by calling poll() regularly (no background threads)
- Drain poll_signal() after each poll()
===============================================================================
*/

template <
    transport::WebSocketConcept WS,
    core::ClockConcept Clock = std::chrono::steady_clock
>
class Connection {
public:
    using clock_type = Clock;
    using time_point = typename Clock::time_point;

    explicit Connection(ReconnectPolicy policy = {}) noexcept
        : policy_(policy)
        , rng_(static_cast<std::uint32_t>(Clock::now().time_since_epoch().count()))
    {
        if (policy_.max_attempts < 0) {
            policy_.max_attempts = 0;
        }
        if (policy_.base_delay < std::chrono::milliseconds::zero()) {
            policy_.base_delay = std::chrono::milliseconds::zero();
        }
        if (policy_.jitter < std::chrono::milliseconds::zero()) {
            policy_.jitter = std::chrono::milliseconds::zero();
        }
    }

    // Ensure transport is closed on destruction.
    // Reconnection is not attempted after object lifetime ends.
    ~Connection() {
        if (ws_ && state_ != State::Disconnected) {
            ws_->close(CloseCode::Normal, "Client disconnect");
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Connection lifecycle
    [[nodiscard]]
    inline Error open(std::string_view url) noexcept {
        PL_DEBUG("[CONN] Connecting to: " << url);

        // --- Synchronous preconditions (must succeed before FSM starts) ---

        // 0) PRECONDITION: must be disconnected (a pending retry is overridden)
        if (state_ != State::Disconnected) {
            PL_WARN("[CONN] open() called while not disconnected (state: " << to_string(state_) << "). Ignoring.");
            return Error::InvalidState;
        }
        // 1) PRECONDITION: parse and validate URL (plain ws:// only, no TLS layer)
        ParsedUrl tmp;
        Error err = parse_url(url, tmp);
        if (err != Error::None) {
            PL_ERROR("[CONN] URL parsing failed: " << url);
            return err;
        }
        if (tmp.scheme != "ws") {
            PL_ERROR("[CONN] Unsupported scheme '" << tmp.scheme << "' (ws:// required): " << url);
            return Error::InvalidUrl;
        }
        last_url_ = std::string(url);
        parsed_url_ = std::move(tmp);

        // 2) Explicit intent starts a fresh outage budget and invalidates any pending retry
        ++epoch_;
        retry_attempts_ = 0;
        last_delay_ = std::chrono::milliseconds::zero();

        // 3) Enter FSM and start the asynchronous open
        transition_(Event::OpenRequested);
        return start_attempt_();
    }

    // Manual disconnect - closes with the given code (CloseCode::Normal by
    // default, which suppresses reconnection) and cancels any pending retry.
    inline void close(CloseCode code = CloseCode::Normal, std::string_view reason = "Client disconnect") noexcept {
        ++epoch_;
        if (state_ == State::Disconnected) {
            return; // idempotent
        }
        close_code_ = to_value(code);
        close_reason_ = std::string(reason);
        transition_(Event::CloseRequested);
    }

    // Sending (at-most-once, current transport only)
    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (state_ != State::Connected) {
            PL_WARN("[CONN] send() called while not connected (state: " << to_string(state_) << "). Ignoring.");
            return false;
        }
        if (text.size() > policy_.max_frame_size) {
            PL_WARN("[CONN] Outbound frame of " << text.size() << " bytes exceeds limit of "
                    << policy_.max_frame_size << " bytes. Dropped.");
            return false;
        }
        if (!ws_->send(text)) {
            PL_WARN("[CONN] Transport rejected outbound frame.");
            return false;
        }
        ++tx_messages_;
        return true;
    }

    // Event loop
    inline void poll() noexcept {
        // === Drive transport I/O and drain its events ===
        if (ws_) {
            ws_->poll();
            websocket::Event ev;
            while (ws_->poll_event(ev)) {
                on_transport_event_(ev);
            }
        }
        // === Reconnection logic ===
        if (retry_ && Clock::now() >= retry_->due) {
            const PendingRetry retry = *retry_;
            retry_.reset();
            if (retry.epoch != epoch_) {
                PL_DEBUG("[CONN] Discarding stale reconnection timer (epoch " << retry.epoch << ", current " << epoch_ << ")");
            }
            else if (state_ == State::Disconnected) {
                reconnect_();
            }
        }
    }

    [[nodiscard]]
    inline bool poll_signal(connection::Signal& out) noexcept {
        if (signals_.empty()) {
            return false;
        }
        out = std::move(signals_.front());
        signals_.pop_front();
        return true;
    }

    // Accessors
    [[nodiscard]]
    inline State state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline bool is_connected() const noexcept {
        return state_ == State::Connected;
    }

    [[nodiscard]]
    inline std::uint64_t epoch() const noexcept {
        return epoch_;
    }

    [[nodiscard]]
    inline int retry_attempts() const noexcept {
        return retry_attempts_;
    }

    // True while an armed retry belongs to the current epoch
    [[nodiscard]]
    inline bool is_retry_pending() const noexcept {
        return retry_.has_value() && retry_->epoch == epoch_;
    }

    [[nodiscard]]
    inline const ReconnectPolicy& policy() const noexcept {
        return policy_;
    }

    [[nodiscard]]
    inline const std::string& url() const noexcept {
        return last_url_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return rx_messages_;
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return tx_messages_;
    }

#ifdef PL_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }

    [[nodiscard]]
    bool has_transport() const noexcept {
        return static_cast<bool>(ws_);
    }
#endif // PL_UNIT_TEST

private:
    struct PendingRetry {
        time_point due;
        std::uint64_t epoch;
    };

    ReconnectPolicy policy_;
    std::string last_url_;                  // for logging
    std::optional<ParsedUrl> parsed_url_;   // Invariant: set once open() accepted a URL

    std::unique_ptr<WS> ws_;                // WebSocket instance (owned by Connection)

    // State machine
    State state_{State::Disconnected};
    std::uint64_t epoch_{0};

    // Retry bookkeeping
    int retry_attempts_{0};                 // number of attempts scheduled in the current outage
    std::chrono::milliseconds last_delay_{0};
    std::optional<PendingRetry> retry_;
    std::minstd_rand rng_;

    // Resolution of the last transport loss
    Error last_error_{Error::None};
    std::uint16_t close_code_{0};
    std::string close_reason_;

    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};

    std::deque<connection::Signal> signals_;

private:
    inline void emit_(connection::Signal sig) {
        PL_TRACE("[CONN] Emitting signal: " << to_string(sig));
        signals_.push_back(std::move(sig));
    }

    inline void set_state_(State new_state) noexcept {
        PL_TRACE("[CONN] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
    }

    // State machine transition function
    inline void transition_(Event event, Error error = Error::None) noexcept {
        PL_TRACE("[FSM] (" << to_string(state_) << ") --" << to_string(event) << "-->");

        switch (state_) {

        // ================================================================
        case State::Disconnected:
            switch (event) {
            case Event::OpenRequested:
            case Event::RetryTimerExpired:
                set_state_(State::Connecting);
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connecting:
            switch (event) {
            case Event::TransportOpened:
                set_state_(State::Connected);
                // Reset retry state
                retry_attempts_ = 0;
                last_delay_ = std::chrono::milliseconds::zero();
                last_error_ = Error::None;
                emit_(connection::Signal::connected());
                PL_INFO("[CONN] Connected to server: " << last_url_);
                break;

            case Event::TransportOpenFailed:
                // The attempt never got in flight: retry only transient causes
                on_lost_(should_retry_(error));
                break;

            case Event::TransportClosed:
                // Failing while opening counts exactly like a post-connection close
                on_lost_(close_code_ != to_value(CloseCode::Normal));
                break;

            case Event::CloseRequested:
                shutdown_();
                break;

            default:
                break;
            }
            break;

        // ================================================================
        case State::Connected:
            switch (event) {
            case Event::TransportClosed:
                on_lost_(close_code_ != to_value(CloseCode::Normal));
                break;

            case Event::CloseRequested:
                shutdown_();
                break;

            default:
                break;
            }
            break;
        }
    }

    // Local close: the transport finishes its closing handshake on later
    // polls, its Close event is ignored because we are already Disconnected.
    inline void shutdown_() noexcept {
        PL_DEBUG("[CONN] Disconnecting from: " << last_url_);
        ws_->close(static_cast<CloseCode>(close_code_), close_reason_);
        set_state_(State::Disconnected);
        emit_(connection::Signal::disconnected(close_code_, close_reason_));
        PL_INFO("[CONN] Disconnected from server: " << last_url_ << " (code " << close_code_ << ")");
    }

    inline void on_lost_(bool retry) noexcept {
        set_state_(State::Disconnected);
        emit_(connection::Signal::disconnected(close_code_, close_reason_));
        PL_INFO("[CONN] Connection closed: " << last_url_ << " (code " << close_code_
                << (close_reason_.empty() ? "" : ", reason: ") << close_reason_ << ")");
        if (!retry) {
            PL_DEBUG("[CONN] No reconnection after code " << close_code_ << " / " << to_string(last_error_));
            return;
        }
        schedule_next_retry_();
    }

    inline void on_transport_event_(websocket::Event& ev) noexcept {
        switch (ev.type) {
            case websocket::EventType::Open:
                transition_(Event::TransportOpened);
                break;

            case websocket::EventType::Message:
                if (state_ != State::Connected) {
                    PL_TRACE("[CONN] Dropping frame received while " << to_string(state_));
                    break;
                }
                ++rx_messages_;
                emit_(connection::Signal::message(std::move(ev.data)));
                break;

            case websocket::EventType::Error:
                if (state_ == State::Disconnected) {
                    break; // closing leftovers of a deliberately closed transport
                }
                PL_WARN("[CONN] Transport error: " << to_string(ev.error));
                last_error_ = ev.error;
                emit_(connection::Signal::failure(ev.error));
                break;

            case websocket::EventType::Close:
                if (state_ == State::Disconnected) {
                    break; // already resolved by close()
                }
                close_code_ = ev.code;
                close_reason_ = std::move(ev.data);
                transition_(Event::TransportClosed);
                break;
        }
    }

    // Start one asynchronous open on a fresh transport instance
    inline Error start_attempt_() noexcept {
        create_transport_();
        const ParsedUrl& u = *parsed_url_;
        const Error err = ws_->connect(u.host, u.port, u.path);
        if (err != Error::None) {
            PL_ERROR("[CONN] Connection attempt failed (" << to_string(err) << ")");
            last_error_ = err;
            close_code_ = to_value(CloseCode::Abnormal);
            close_reason_ = std::string(to_string(err));
            emit_(connection::Signal::failure(err));
            transition_(Event::TransportOpenFailed, err);
        }
        return err;
    }

    inline void create_transport_() {
        // If exists, ensure old transport is torn down deterministically
        if (ws_) {
            ws_.reset();
        }
        ws_ = std::make_unique<WS>();
        last_error_ = Error::None;
        close_code_ = 0;
        close_reason_.clear();
    }

    inline void reconnect_() noexcept {
        PL_DEBUG("[CONN] Reconnecting to: " << last_url_ << " (attempt " << retry_attempts_ << ")");
        transition_(Event::RetryTimerExpired);
        (void)start_attempt_();
    }

    // Determines whether a failure to even start an attempt is worth retrying
    [[nodiscard]]
    inline bool should_retry_(Error error) const noexcept {
        const bool retry = is_retryable(error);
        PL_TRACE("[CONN] should retry after '" << to_string(error) << "'? -> " << (retry ? "YES" : "NO"));
        return retry;
    }

    // Schedule next retry with backoff, or give up once the cap is reached
    inline void schedule_next_retry_() noexcept {
        if (retry_attempts_ >= policy_.max_attempts) {
            PL_ERROR("[CONN] Giving up after " << retry_attempts_ << " reconnection attempts: " << last_url_);
            retry_.reset();
            emit_(connection::Signal::retry_exhausted(retry_attempts_));
            return;
        }
        ++retry_attempts_;
        const auto delay = backoff_(retry_attempts_);
        retry_ = PendingRetry{
            std::chrono::time_point_cast<typename Clock::duration>(Clock::now() + delay),
            epoch_
        };
        emit_(connection::Signal::retry_scheduled(retry_attempts_, delay));
        PL_INFO("[CONN] Reconnection attempt " << retry_attempts_ << "/" << policy_.max_attempts
                << " in " << delay.count() << " ms");
    }

    [[nodiscard]]
    inline std::chrono::milliseconds backoff_(int attempt) noexcept {
        // Clamp exponent to avoid overflow
        const int exponent = std::clamp(attempt - 1, 0, 20);
        auto delay = policy_.base_delay * (std::int64_t{1} << exponent);
        if (policy_.jitter > std::chrono::milliseconds::zero()) {
            std::uniform_int_distribution<std::int64_t> dist(0, policy_.jitter.count());
            delay += std::chrono::milliseconds(dist(rng_));
        }
        // Successive delays within one outage never decrease
        delay = std::max(delay, last_delay_);
        last_delay_ = delay;
        return delay;
    }
};

} // namespace poslink::core::transport
