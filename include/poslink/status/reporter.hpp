#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "poslink/core/clock.hpp"
#include "poslink/dispatch/bus.hpp"
#include "poslink/dispatch/category.hpp"
#include "poslink/host/lifecycle.hpp"
#include "poslink/status/channel_concept.hpp"
#include "poslink/status/snapshot.hpp"
#include "poslink/log/logger.hpp"


namespace poslink::status {

inline constexpr auto DEFAULT_REPORT_INTERVAL = std::chrono::seconds(30);

/*
===============================================================================
 status::Reporter
===============================================================================

Keeps the registry's view of this terminal current, independently of the
socket traffic.

  • start(lifecycle) registers the terminal once, arms the periodic status
    update and attaches to the host visibility / teardown signals
  • every interval: "online" or "offline" depending on network reachability
  • hidden → "offline", visible → "online", teardown → "offline", sent at once
  • a failed registration is retried when the bus reports "connected"
  • stop() disarms the interval and detaches every listener; start() after
    stop() behaves like the first start (no duplicate timers)

Status reporting is advisory: every failure is logged and swallowed.

The periodic tick belongs to one start(); stop() disarms it, so restarting
never leaves two timers running.
===============================================================================
*/

template<
    StatusChannelConcept Channel,
    core::ClockConcept Clock = std::chrono::steady_clock
>
class Reporter {
public:
    using SnapshotSource = std::function<Snapshot()>;
    using Reachability = std::function<bool()>;

    Reporter(Channel& channel,
             SnapshotSource snapshot,
             Reachability reachable,
             std::chrono::milliseconds interval = DEFAULT_REPORT_INTERVAL)
        : channel_(channel)
        , snapshot_(std::move(snapshot))
        , reachable_(std::move(reachable))
        , interval_(interval)
        , alive_(std::make_shared<bool>(true))
    {
        if (interval_ <= std::chrono::milliseconds::zero()) {
            interval_ = DEFAULT_REPORT_INTERVAL;
        }
    }

    ~Reporter() {
        stop();
    }

    Reporter(const Reporter&) = delete;
    Reporter& operator=(const Reporter&) = delete;

    // Re-register on the next "connected" if the last registration failed
    inline void watch(dispatch::Bus& bus) {
        connected_sub_ = dispatch::Subscription(bus, dispatch::category::Connected,
            bus.subscribe(dispatch::category::Connected, [this](std::string_view) { on_connected_(); }));
    }

    inline void start(host::Lifecycle& lifecycle) {
        if (running_) {
            stop();
        }
        running_ = true;
        ++epoch_;
        registering_ = false;
        PL_INFO("[STATUS] Status reporting started (interval " << interval_.count() << " ms)");

        lifecycle_ = &lifecycle;
        visibility_listener_ = lifecycle.on_visibility([this](bool visible) {
            report(visible ? HostStatus::Online : HostStatus::Offline);
        });
        teardown_listener_ = lifecycle.on_teardown([this]() {
            report(HostStatus::Offline);
        });

        register_();
        next_tick_ = std::chrono::time_point_cast<typename Clock::duration>(Clock::now() + interval_);
    }

    inline void stop() {
        if (!running_) {
            return;
        }
        running_ = false;
        ++epoch_;
        next_tick_.reset();
        if (lifecycle_) {
            lifecycle_->detach(visibility_listener_);
            lifecycle_->detach(teardown_listener_);
            lifecycle_ = nullptr;
        }
        visibility_listener_ = host::Lifecycle::INVALID_LISTENER;
        teardown_listener_ = host::Lifecycle::INVALID_LISTENER;
        PL_INFO("[STATUS] Status reporting stopped");
    }

    inline void poll() {
        channel_.poll();
        if (!running_ || !next_tick_ || Clock::now() < *next_tick_) {
            return;
        }
        // Re-arm from now: a stalled loop does not cause a burst of catch-up reports
        next_tick_ = std::chrono::time_point_cast<typename Clock::duration>(Clock::now() + interval_);
        report(reachable_() ? HostStatus::Online : HostStatus::Offline);
    }

    // Out-of-band status update (best effort)
    inline void report(HostStatus status) {
        if (!running_) {
            return;
        }
        PL_DEBUG("[STATUS] Reporting '" << to_string(status) << "'");
        ++updates_sent_;
        channel_.update_status(snapshot_(), status, guarded_([this, status](bool ok) {
            if (!ok) {
                ++failures_;
                PL_WARN("[STATUS] Status update '" << to_string(status) << "' failed");
            }
        }));
    }

    [[nodiscard]]
    inline bool is_running() const noexcept { return running_; }

    [[nodiscard]]
    inline bool registered() const noexcept { return registered_; }

    [[nodiscard]]
    inline std::uint64_t updates_sent() const noexcept { return updates_sent_; }

    [[nodiscard]]
    inline std::uint64_t failures() const noexcept { return failures_; }

    [[nodiscard]]
    inline std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    Channel& channel_;
    SnapshotSource snapshot_;
    Reachability reachable_;
    std::chrono::milliseconds interval_;

    bool running_{false};
    std::uint64_t epoch_{0};
    std::optional<typename Clock::time_point> next_tick_;

    bool registered_{false};
    bool registering_{false};

    host::Lifecycle* lifecycle_{nullptr};
    host::Lifecycle::ListenerId visibility_listener_{host::Lifecycle::INVALID_LISTENER};
    host::Lifecycle::ListenerId teardown_listener_{host::Lifecycle::INVALID_LISTENER};

    dispatch::Subscription connected_sub_;

    std::uint64_t updates_sent_{0};
    std::uint64_t failures_{0};

    // Completions may arrive after the reporter is gone
    std::shared_ptr<bool> alive_;

private:
    template<class F>
    inline Completion guarded_(F&& f) {
        std::weak_ptr<bool> alive = alive_;
        return [alive, fn = std::forward<F>(f)](bool ok) {
            if (alive.lock()) {
                fn(ok);
            }
        };
    }

    inline void register_() {
        if (registering_) {
            return;
        }
        registering_ = true;
        const std::uint64_t epoch = epoch_;
        PL_DEBUG("[STATUS] Registering terminal");
        channel_.register_terminal(snapshot_(), guarded_([this, epoch](bool ok) {
            if (epoch == epoch_) {
                registering_ = false;
            }
            registered_ = registered_ || ok;
            if (ok) {
                PL_INFO("[STATUS] Terminal registered");
            } else {
                ++failures_;
                PL_WARN("[STATUS] Terminal registration failed"
                        << (epoch == epoch_ ? ", retrying on next connection" : ""));
            }
        }));
    }

    inline void on_connected_() {
        if (running_ && !registered_) {
            PL_DEBUG("[STATUS] Connected while unregistered -> registering again");
            register_();
        }
    }
};

} // namespace poslink::status
