#include "grocery/errors.hpp"
#include "grocery/config.hpp"
#include "grocery/helpers.hpp"
#include "grocery/inventory.grpc.pb.h"
#include "grocery/logging.hpp"
#include "grocery/order_json.hpp"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace {

constexpr int EXIT_CODE_OK = 0;
constexpr int EXIT_CODE_FAILURE = 1;
constexpr int EXIT_CODE_BAD_REQUEST = 2;

int usage() {
    std::cerr << "usage: grocery_order <grocery|restock> <order.json>" << std::endl;
    return EXIT_CODE_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc != 3) return usage();

    std::string kind = argv[1];
    grocery::MessageType message_type = grocery::MESSAGE_TYPE_UNSPECIFIED;
    if (kind == "grocery") {
        message_type = grocery::GROCERY_ORDER;
    } else if (kind == "restock") {
        message_type = grocery::RESTOCK_ORDER;
    } else {
        return usage();
    }

    std::ifstream input(argv[2]);
    if (!input) {
        grocery::log_error("order-cli", "order_file_unreadable", {{"path", argv[2]}});
        return EXIT_CODE_FAILURE;
    }

    nlohmann::json body;
    try {
        input >> body;
    } catch (const nlohmann::json::parse_error& e) {
        grocery::log_error("order-cli", "order_file_invalid", {{"path", argv[2]}, {"error", e.what()}});
        return EXIT_CODE_FAILURE;
    }

    grocery::OrderClientConfig config;
    try {
        config = grocery::OrderClientConfig::from_env();
    } catch (const grocery::GroceryError& e) {
        grocery::log_error("order-cli", "invalid_configuration", {{"error", e.what()}});
        return EXIT_CODE_FAILURE;
    }

    auto request = grocery::order_request_from_json(body, message_type);

    const std::string& endpoint = config.inventory_address;
    auto channel = grpc::CreateChannel(grocery::helpers::format_endpoint(endpoint),
                                       grpc::InsecureChannelCredentials());
    auto stub = grocery::InventoryService::NewStub(channel);

    grocery::OrderReply reply;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + config.call_deadline);
    auto status = stub->ProcessOrder(&context, request, &reply);
    if (!status.ok()) {
        grocery::GrpcError error(status.error_message(), status.error_code());
        grocery::log_error("order-cli", "process_order_failed",
            {{"endpoint", endpoint}, {"error", error.what()},
             {"connection_error", error.is_connection_error()}});
        return EXIT_CODE_FAILURE;
    }

    std::cout << grocery::order_reply_to_json(reply).dump(2) << std::endl;
    switch (reply.code()) {
        case grocery::OK: return EXIT_CODE_OK;
        case grocery::BAD_REQUEST: return EXIT_CODE_BAD_REQUEST;
        default: return EXIT_CODE_FAILURE;
    }
}
