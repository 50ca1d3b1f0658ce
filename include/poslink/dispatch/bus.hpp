#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>


namespace poslink::dispatch {

/*
================================================================================
 dispatch::Bus
================================================================================

Category-keyed publish/subscribe registry. The session publishes decoded
inbound payloads and lifecycle facts; application code subscribes.

Semantics:
  • Callbacks of one category run in registration order, synchronously, on
    the publishing thread
  • publish() iterates a snapshot taken when it starts: callbacks may
    subscribe or unsubscribe (themselves or others) freely
  • A callback that throws is logged and skipped; the remaining callbacks of
    the same publish() still run
  • unsubscribe() of an unknown id is a no-op

Payloads are JSON text (the message payload, or a small lifecycle object).

The bus is single-threaded, like the loop that drives the session.
================================================================================
*/

using SubscriptionId = std::uint64_t;

inline constexpr SubscriptionId INVALID_SUBSCRIPTION = 0;

class Bus {
public:
    using Callback = std::function<void(std::string_view payload)>;

    Bus() = default;
    Bus(const Bus&) = delete;
    Bus& operator=(const Bus&) = delete;

    [[nodiscard]]
    SubscriptionId subscribe(std::string_view category, Callback cb);

    void unsubscribe(std::string_view category, SubscriptionId id) noexcept;

    void publish(std::string_view category, std::string_view payload);

    [[nodiscard]]
    std::size_t subscriber_count(std::string_view category) const noexcept;

    void clear() noexcept;

private:
    struct Entry {
        SubscriptionId id;
        std::shared_ptr<const Callback> callback;
    };

    std::map<std::string, std::vector<Entry>, std::less<>> subscribers_;
    SubscriptionId next_id_{1};
};


// Movable handle that unsubscribes on destruction.
// The bus must outlive every Subscription created from it.
class Subscription {
public:
    Subscription() noexcept = default;

    Subscription(Bus& bus, std::string_view category, SubscriptionId id)
        : bus_(&bus)
        , category_(category)
        , id_(id)
    {}

    Subscription(Subscription&& other) noexcept
        : bus_(other.bus_)
        , category_(std::move(other.category_))
        , id_(other.id_)
    {
        other.bus_ = nullptr;
        other.id_ = INVALID_SUBSCRIPTION;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            category_ = std::move(other.category_);
            id_ = other.id_;
            other.bus_ = nullptr;
            other.id_ = INVALID_SUBSCRIPTION;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() {
        reset();
    }

    inline void reset() noexcept {
        if (bus_ && id_ != INVALID_SUBSCRIPTION) {
            bus_->unsubscribe(category_, id_);
        }
        bus_ = nullptr;
        id_ = INVALID_SUBSCRIPTION;
    }

    [[nodiscard]]
    inline bool active() const noexcept {
        return bus_ != nullptr && id_ != INVALID_SUBSCRIPTION;
    }

    [[nodiscard]]
    inline SubscriptionId id() const noexcept {
        return id_;
    }

    [[nodiscard]]
    inline const std::string& category() const noexcept {
        return category_;
    }

private:
    Bus* bus_{nullptr};
    std::string category_;
    SubscriptionId id_{INVALID_SUBSCRIPTION};
};

} // namespace poslink::dispatch
