#pragma once

#include <string>

#include "poslink/json/writer.hpp"


namespace poslink::core::protocol::schema {

// Shared by the outbound inventory_change report and the inbound
// inventory_changed broadcast. Quantities are plain JSON numbers so that
// weighed goods keep their fractional part.
struct InventoryChange {
    std::string product_id;
    double old_quantity{0.0};
    double new_quantity{0.0};
    std::string reason;

    inline void write_json(std::string& out) const {
        out += '{';
        json::append_key(out, "productId");
        json::append_string(out, product_id);
        out += ',';
        json::append_key(out, "oldQuantity");
        json::append(out, old_quantity);
        out += ',';
        json::append_key(out, "newQuantity");
        json::append(out, new_quantity);
        out += ',';
        json::append_key(out, "reason");
        json::append_string(out, reason);
        out += '}';
    }
};

} // namespace poslink::core::protocol::schema
