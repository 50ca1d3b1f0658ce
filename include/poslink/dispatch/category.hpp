#pragma once

#include <string_view>


namespace poslink::dispatch::category {

// Lifecycle categories published by the session
inline constexpr std::string_view Connected          = "connected";
inline constexpr std::string_view Disconnected       = "disconnected";
inline constexpr std::string_view TerminalAssigned   = "terminal_assigned";
inline constexpr std::string_view Error              = "error";
inline constexpr std::string_view ReconnectScheduled = "reconnect_scheduled";
inline constexpr std::string_view MaxReconnectAttemptsReached = "max_reconnect_attempts_reached";

// Inbound frames whose type is outside the known set
inline constexpr std::string_view UnknownMessage     = "unknown_message";

} // namespace poslink::dispatch::category
