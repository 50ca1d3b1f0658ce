#pragma once

#include <concepts>
#include <functional>

#include "poslink/status/snapshot.hpp"


namespace poslink::status {

// Completion of one side-channel request: true on a 2xx answer
using Completion = std::function<void(bool ok)>;

/*
===============================================================================
 StatusChannelConcept
===============================================================================

Side channel used by the Reporter to reach the terminal registry.

  register_terminal(snapshot, done)      idempotent upsert keyed on terminal id
  update_status(snapshot, status, done)  status patch keyed on terminal id
  poll()                                 drives I/O on the caller's thread

`done` is invoked exactly once per request, from poll() (or immediately when
the request cannot even be started). Channels never throw.
===============================================================================
*/

template<class C>
concept StatusChannelConcept =
    requires(C ch, const Snapshot& snapshot, HostStatus status, Completion done) {
        { ch.register_terminal(snapshot, done) } -> std::same_as<void>;
        { ch.update_status(snapshot, status, done) } -> std::same_as<void>;
        { ch.poll() } -> std::same_as<void>;
    };

} // namespace poslink::status
