#pragma once

#include "poslink/core/protocol/schema/inventory_change.hpp"
#include "poslink/core/protocol/parser/helpers.hpp"
#include "poslink/log/logger.hpp"

#include "simdjson.h"

namespace poslink::core::protocol::parser {

struct inventory_change {

    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::InventoryChange& out) noexcept {
        auto r = helper::require_object(root);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] inventory payload is not an object -> ignore message.");
            return r;
        }
        r = helper::parse_id_required(root, "productId", out.product_id);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'productId' missing or invalid in inventory payload -> ignore message.");
            return r;
        }
        r = helper::parse_number_required(root, "oldQuantity", out.old_quantity);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'oldQuantity' missing or invalid in inventory payload -> ignore message.");
            return r;
        }
        r = helper::parse_number_required(root, "newQuantity", out.new_quantity);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'newQuantity' missing or invalid in inventory payload -> ignore message.");
            return r;
        }
        r = helper::parse_string_required(root, "reason", out.reason);
        if (r != Result::Parsed) {
            PL_DEBUG("[PARSER] Field 'reason' missing or invalid in inventory payload -> ignore message.");
            return r;
        }
        return Result::Parsed;
    }
};

} // namespace poslink::core::protocol::parser
