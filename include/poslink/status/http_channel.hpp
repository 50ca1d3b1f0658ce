#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "poslink/status/channel_concept.hpp"
#include "poslink/status/snapshot.hpp"


namespace poslink::status {

struct HttpChannelConfig {
    std::string api_url{"http://localhost:3000/api"};
    std::string auth_token;                         // "Authorization: Bearer <token>" when set
    std::chrono::milliseconds timeout{5000};        // whole request budget
};

/*
================================================================================
 status::HttpChannel (Boost.Beast HTTP/1.1, poll-driven)
================================================================================

  POST  {api}/network/terminals                               registration
  PATCH {api}/network/terminals/by-terminal-id/{id}/status    status update

Each request runs on its own connection over a private io_context that only
advances inside poll(). Requests may overlap. Plain http:// only.
================================================================================
*/

class HttpChannel {
public:
    explicit HttpChannel(HttpChannelConfig cfg);
    ~HttpChannel();

    HttpChannel(const HttpChannel&) = delete;
    HttpChannel& operator=(const HttpChannel&) = delete;

    void register_terminal(const Snapshot& snapshot, Completion done);

    void update_status(const Snapshot& snapshot, HostStatus status, Completion done);

    void poll() noexcept;

    // Requests started and not yet completed
    [[nodiscard]]
    std::size_t in_flight() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace poslink::status
