#pragma once

#include <string>
#include <utility>
#include <vector>

#include "poslink/status/channel_concept.hpp"
#include "poslink/status/snapshot.hpp"


namespace poslink::status::test {

// Records every request. Completions run immediately with the scripted
// outcome, or are held back until complete_pending() when deferred.
class RecordingChannel {
public:
    struct Update {
        Snapshot snapshot;
        HostStatus status;
    };

    inline void register_terminal(const Snapshot& snapshot, Completion done) {
        registrations.push_back(snapshot);
        finish_(std::move(done), register_ok);
    }

    inline void update_status(const Snapshot& snapshot, HostStatus status, Completion done) {
        updates.push_back({snapshot, status});
        finish_(std::move(done), update_ok);
    }

    inline void poll() {
        ++polls;
    }

    // Run held-back completions with the given outcome
    inline void complete_pending(bool ok) {
        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& done : pending) {
            done(ok);
        }
    }

    [[nodiscard]]
    inline std::size_t pending() const noexcept {
        return pending_.size();
    }

    [[nodiscard]]
    inline std::size_t count(HostStatus status) const noexcept {
        std::size_t n = 0;
        for (const auto& u : updates) {
            n += (u.status == status) ? 1 : 0;
        }
        return n;
    }

    bool register_ok{true};
    bool update_ok{true};
    bool deferred{false};

    std::vector<Snapshot> registrations;
    std::vector<Update> updates;
    int polls{0};

private:
    std::vector<Completion> pending_;

    inline void finish_(Completion done, bool ok) {
        if (deferred) {
            pending_.push_back(std::move(done));
        } else if (done) {
            done(ok);
        }
    }
};

static_assert(StatusChannelConcept<RecordingChannel>);

} // namespace poslink::status::test
