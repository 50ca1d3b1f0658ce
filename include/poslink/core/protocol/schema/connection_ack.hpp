#pragma once

#include <optional>
#include <string>


namespace poslink::core::protocol::schema {

// connection_ack: session identity assignment
struct ConnectionAck {
    std::string terminal_id;
    std::optional<std::string> message;
};

} // namespace poslink::core::protocol::schema
