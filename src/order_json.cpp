#include "grocery/order_json.hpp"

#include <cstdlib>
#include "grocery/helpers.hpp"

namespace grocery {

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object() || !object.contains(key)) return "";
    const auto& value = object.at(key);
    if (value.is_string()) return trim(value.get<std::string>());
    if (value.is_number()) return value.dump();
    return "";
}

double qty_field(const nlohmann::json& entry) {
    if (!entry.contains("qty")) return 0.0;
    const auto& value = entry.at("qty");
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        auto text = trim(value.get<std::string>());
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (!text.empty() && end && *end == '\0') return parsed;
    }
    return 0.0;
}

void fill_aisle(const nlohmann::json& order, const char* aisle, AisleItems* out) {
    if (!order.contains(aisle) || !order.at(aisle).is_array()) return;

    for (const auto& entry : order.at(aisle)) {
        if (!entry.is_object()) continue;
        auto name = string_field(entry, "item");
        double qty = qty_field(entry);
        // NaN fails this comparison too.
        if (name.empty() || !(qty > 0)) continue;

        auto* item = out->add_items();
        item->set_item(name);
        item->set_qty(qty);
    }
}

} // anonymous namespace

OrderRequest order_request_from_json(const nlohmann::json& body, MessageType message_type) {
    OrderRequest request;
    request.set_message_type(message_type);
    request.set_timestamp_ms(helpers::now_ms());
    if (message_type == RESTOCK_ORDER) {
        request.set_supplier_id(string_field(body, "supplier_id"));
    } else {
        request.set_customer_id(string_field(body, "customer_id"));
    }

    if (!body.is_object() || !body.contains("order") || !body.at("order").is_object()) {
        return request;
    }

    const auto& order = body.at("order");
    auto* out = request.mutable_order();
    fill_aisle(order, "bread", out->mutable_bread());
    fill_aisle(order, "dairy", out->mutable_dairy());
    fill_aisle(order, "meat", out->mutable_meat());
    fill_aisle(order, "produce", out->mutable_produce());
    fill_aisle(order, "party", out->mutable_party());
    return request;
}

nlohmann::json order_reply_to_json(const OrderReply& reply) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : reply.items()) {
        items.push_back({{"item", item.item()}, {"qty", item.qty()}});
    }

    nlohmann::json out = {
        {"code", reply_code_name(reply.code())},
        {"message", reply.message()},
        {"items", items}
    };
    if (reply.has_total_price()) {
        out["total_price"] = reply.total_price();
    }
    return out;
}

std::string reply_code_name(ReplyCode code) {
    switch (code) {
        case OK: return "OK";
        case BAD_REQUEST: return "BAD_REQUEST";
        case INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "REPLY_CODE_UNSPECIFIED";
    }
}

} // namespace grocery
