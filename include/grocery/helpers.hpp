#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <google/protobuf/repeated_ptr_field.h>
#include "grocery/common.pb.h"
#include "grocery/inventory.pb.h"
#include "types.hpp"

namespace grocery {

/**
 * Helper functions for working with grocery wire types.
 */
namespace helpers {

/**
 * Milliseconds since the Unix epoch.
 */
int64_t now_ms();

/**
 * Convert wire items into line items.
 */
std::vector<LineItem> to_line_items(const google::protobuf::RepeatedPtrField<ItemQty>& items);

/**
 * Append line items to a repeated wire field.
 */
void append_items(const std::vector<LineItem>& items,
                  google::protobuf::RepeatedPtrField<ItemQty>* out);

/**
 * Flatten an order into one item list, aisle by aisle.
 */
std::vector<LineItem> flatten_order(const Order& order);

/**
 * Total line-item count across all aisles.
 */
inline int count_items(const Order& order) {
    return order.bread().items_size() + order.dairy().items_size() + order.meat().items_size() +
           order.produce().items_size() + order.party().items_size();
}

/**
 * Identity of whoever placed the order: customer for grocery orders, supplier for restocks.
 */
inline const std::string& actor_id(const OrderRequest& request) {
    return request.message_type() == RESTOCK_ORDER ? request.supplier_id() : request.customer_id();
}

/**
 * Strip an http:// or https:// prefix so the endpoint is plain host:port for gRPC.
 */
inline std::string format_endpoint(const std::string& endpoint) {
    auto pos = endpoint.find("://");
    if (pos == std::string::npos) {
        return endpoint;
    }
    return endpoint.substr(pos + 3);
}

/**
 * Round a money amount to whole cents.
 */
double round_cents(double amount);

} // namespace helpers
} // namespace grocery
