#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "grocery/common.pb.h"
#include "grocery/inventory.pb.h"

namespace grocery {

/**
 * Translate a customer/supplier JSON document into an OrderRequest.
 *
 * Expected shape:
 *   {"customer_id": "c1", "order": {"bread": [{"item": "bagels", "qty": 2}], ...}}
 * with "supplier_id" instead of "customer_id" for restocks.
 *
 * Entries that are not objects, have no name, or whose qty is not a positive
 * number are dropped, and unknown aisle keys are ignored. Whether what remains
 * is a valid order is for the coordinator to decide.
 */
OrderRequest order_request_from_json(const nlohmann::json& body, MessageType message_type);

/**
 * {code, message, items, total_price?}
 */
nlohmann::json order_reply_to_json(const OrderReply& reply);

std::string reply_code_name(ReplyCode code);

} // namespace grocery
