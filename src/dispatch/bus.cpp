#include "poslink/dispatch/bus.hpp"

#include <algorithm>
#include <exception>

#include "poslink/log/logger.hpp"


namespace poslink::dispatch {

SubscriptionId Bus::subscribe(std::string_view category, Callback cb) {
    if (!cb) {
        PL_WARN("[BUS] Ignoring empty callback for '" << category << "'");
        return INVALID_SUBSCRIPTION;
    }
    const SubscriptionId id = next_id_++;
    auto it = subscribers_.find(category);
    if (it == subscribers_.end()) {
        it = subscribers_.emplace(std::string(category), std::vector<Entry>{}).first;
    }
    it->second.push_back(Entry{id, std::make_shared<const Callback>(std::move(cb))});
    PL_TRACE("[BUS] Subscribed #" << id << " to '" << category << "'");
    return id;
}

void Bus::unsubscribe(std::string_view category, SubscriptionId id) noexcept {
    auto it = subscribers_.find(category);
    if (it == subscribers_.end()) {
        return;
    }
    auto& entries = it->second;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [id](const Entry& e) { return e.id == id; }),
                  entries.end());
    if (entries.empty()) {
        subscribers_.erase(it);
    }
}

void Bus::publish(std::string_view category, std::string_view payload) {
    auto it = subscribers_.find(category);
    if (it == subscribers_.end()) {
        PL_TRACE("[BUS] No subscribers for '" << category << "'");
        return;
    }
    // Snapshot: callbacks may mutate the registry while we iterate
    const std::vector<Entry> snapshot = it->second;
    for (const Entry& e : snapshot) {
        try {
            (*e.callback)(payload);
        }
        catch (const std::exception& ex) {
            PL_ERROR("[BUS] Subscriber #" << e.id << " of '" << category << "' threw: " << ex.what());
        }
        catch (...) {
            PL_ERROR("[BUS] Subscriber #" << e.id << " of '" << category << "' threw a non-standard exception");
        }
    }
}

std::size_t Bus::subscriber_count(std::string_view category) const noexcept {
    auto it = subscribers_.find(category);
    return it == subscribers_.end() ? 0 : it->second.size();
}

void Bus::clear() noexcept {
    subscribers_.clear();
}

} // namespace poslink::dispatch
