#pragma once

#include <string>

#include "poslink/json/writer.hpp"


namespace poslink::core::protocol::schema {

// price_request: ask the server for live price and availability
struct PriceRequest {
    std::string product_id;
    std::string barcode;

    inline void write_json(std::string& out) const {
        out += '{';
        json::append_key(out, "productId");
        json::append_string(out, product_id);
        out += ',';
        json::append_key(out, "barcode");
        json::append_string(out, barcode);
        out += '}';
    }
};

} // namespace poslink::core::protocol::schema
