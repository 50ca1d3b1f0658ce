#pragma once

#include <cstdint>
#include <string_view>


namespace poslink::core::protocol {

// ===============================================
// INBOUND MESSAGE TYPES (server → client)
// ===============================================
enum class MessageType : std::uint8_t {
    Unknown = 0,
    ConnectionAck,
    PriceResponse,
    InventoryChanged,
    TerminalStatus,
    TransactionSync,
    EmployeeAction,
};

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::ConnectionAck:    return "connection_ack";
        case MessageType::PriceResponse:    return "price_response";
        case MessageType::InventoryChanged: return "inventory_changed";
        case MessageType::TerminalStatus:   return "terminal_status";
        case MessageType::TransactionSync:  return "transaction_sync";
        case MessageType::EmployeeAction:   return "employee_action";
        default:                            return "unknown_message";
    }
}

[[nodiscard]]
inline constexpr MessageType message_type_from_string(std::string_view s) noexcept {
    if (s == "connection_ack")    return MessageType::ConnectionAck;
    if (s == "price_response")    return MessageType::PriceResponse;
    if (s == "inventory_changed") return MessageType::InventoryChanged;
    if (s == "terminal_status")   return MessageType::TerminalStatus;
    if (s == "transaction_sync")  return MessageType::TransactionSync;
    if (s == "employee_action")   return MessageType::EmployeeAction;
    return MessageType::Unknown;
}

// ===============================================
// OUTBOUND MESSAGE TYPES (client → server)
// ===============================================
namespace outbound {

inline constexpr std::string_view PriceRequest         = "price_request";
inline constexpr std::string_view InventoryChange      = "inventory_change";
inline constexpr std::string_view TransactionSync      = "transaction_sync";
inline constexpr std::string_view TerminalStatusUpdate = "terminal_status_update";

} // namespace outbound

} // namespace poslink::core::protocol
