#pragma once

#include <optional>
#include <string>


namespace poslink::core::protocol {

/*
===============================================================================
 protocol::Message
===============================================================================

The wire envelope, one per text frame:

    { "type": "...", "payload": <any JSON>, "terminalId": "...", "timestamp": "..." }

The payload is kept as minified JSON text. Typed views are obtained on demand
through the payload parsers, so the envelope never outlives a parser buffer.

terminalId is omitted from the frame when unset; timestamp is ISO-8601 UTC
with millisecond resolution and may be absent on inbound frames.
===============================================================================
*/

struct Message {
    std::string type;
    std::string payload{"null"};
    std::optional<std::string> terminal_id;
    std::string timestamp;
};

} // namespace poslink::core::protocol
