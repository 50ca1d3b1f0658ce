#pragma once

#include <string>

#include "poslink/json/writer.hpp"


namespace poslink::core::protocol::schema {

// price_response: answer to a price_request
struct PriceResponse {
    std::string product_id;
    std::string barcode;
    double price{0.0};
    bool available{false};

    inline void write_json(std::string& out) const {
        out += '{';
        json::append_key(out, "productId");
        json::append_string(out, product_id);
        out += ',';
        json::append_key(out, "barcode");
        json::append_string(out, barcode);
        out += ',';
        json::append_key(out, "price");
        json::append(out, price);
        out += ',';
        json::append_key(out, "available");
        json::append(out, available);
        out += '}';
    }
};

} // namespace poslink::core::protocol::schema
