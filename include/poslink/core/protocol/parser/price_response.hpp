#pragma once

#include "poslink/core/protocol/schema/price_response.hpp"
#include "poslink/core/protocol/parser/helpers.hpp"
#include "poslink/log/logger.hpp"

#include "simdjson.h"

namespace poslink::core::protocol::parser {

struct price_response {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::PriceResponse& out) noexcept {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] price_response payload is not an object -> ignore message.");
            return r;
        }
        r = helper::parse_id_required(root, "productId", out.product_id);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'productId' missing or invalid in price_response -> ignore message.");
            return r;
        }
        r = helper::parse_id_required(root, "barcode", out.barcode);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'barcode' missing or invalid in price_response -> ignore message.");
            return r;
        }
        r = helper::parse_number_required(root, "price", out.price);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'price' missing or invalid in price_response -> ignore message.");
            return r;
        }
        if (out.price < 0.0) {
            PL_DEBUG("[PARSER] Negative 'price' in price_response -> ignore message.");
            return Result::InvalidValue;
        }
        r = helper::parse_bool_required(root, "available", out.available);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'available' missing or invalid in price_response -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace poslink::core::protocol::parser
