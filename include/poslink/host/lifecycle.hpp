#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include "poslink/log/logger.hpp"


namespace poslink::host {

/*
===============================================================================
 host::Lifecycle
===============================================================================

Source of host lifecycle signals: the terminal UI going to the background or
coming back (visibility), and the process shutting down (teardown).

The hosting application calls notify_*(); interested components attach
listeners and detach them with the returned id. Listeners run synchronously,
in attach order, on the notifying thread. A throwing listener is logged and
does not prevent the others from running.
===============================================================================
*/

class Lifecycle {
public:
    using ListenerId = std::uint64_t;
    using VisibilityListener = std::function<void(bool visible)>;
    using TeardownListener = std::function<void()>;

    static constexpr ListenerId INVALID_LISTENER = 0;

    Lifecycle() = default;
    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;

    [[nodiscard]]
    inline ListenerId on_visibility(VisibilityListener fn) {
        const ListenerId id = next_id_++;
        visibility_.push_back({id, std::move(fn)});
        return id;
    }

    [[nodiscard]]
    inline ListenerId on_teardown(TeardownListener fn) {
        const ListenerId id = next_id_++;
        teardown_.push_back({id, std::move(fn)});
        return id;
    }

    // Detach a listener of either kind (no-op for unknown ids)
    inline void detach(ListenerId id) noexcept {
        erase_(visibility_, id);
        erase_(teardown_, id);
    }

    inline void notify_visibility(bool visible) {
        if (visible == visible_) {
            return; // edge-triggered
        }
        visible_ = visible;
        PL_DEBUG("[HOST] Visibility -> " << (visible ? "visible" : "hidden"));
        const auto listeners = visibility_;
        for (const auto& l : listeners) {
            invoke_(l.id, [&] { l.fn(visible); });
        }
    }

    inline void notify_teardown() {
        if (torn_down_) {
            return;
        }
        torn_down_ = true;
        PL_DEBUG("[HOST] Teardown");
        const auto listeners = teardown_;
        for (const auto& l : listeners) {
            invoke_(l.id, [&] { l.fn(); });
        }
    }

    [[nodiscard]]
    inline bool visible() const noexcept { return visible_; }

    [[nodiscard]]
    inline bool torn_down() const noexcept { return torn_down_; }

    [[nodiscard]]
    inline std::size_t listener_count() const noexcept {
        return visibility_.size() + teardown_.size();
    }

private:
    template<class Fn>
    struct Listener {
        ListenerId id;
        Fn fn;
    };

    std::vector<Listener<VisibilityListener>> visibility_;
    std::vector<Listener<TeardownListener>> teardown_;
    ListenerId next_id_{1};
    bool visible_{true};
    bool torn_down_{false};

    template<class Vec>
    static void erase_(Vec& v, ListenerId id) noexcept {
        std::erase_if(v, [id](const auto& l) { return l.id == id; });
    }

    template<class F>
    static void invoke_(ListenerId id, F&& f) {
        try {
            f();
        }
        catch (const std::exception& e) {
            PL_ERROR("[HOST] Lifecycle listener #" << id << " threw: " << e.what());
        }
        catch (...) {
            PL_ERROR("[HOST] Lifecycle listener #" << id << " threw a non-standard exception");
        }
    }
};

} // namespace poslink::host
