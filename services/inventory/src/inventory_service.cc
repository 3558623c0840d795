#include "inventory_service.hpp"

#include <chrono>
#include "grocery/analytics.hpp"
#include "grocery/catalog.hpp"
#include "grocery/errors.hpp"
#include "grocery/helpers.hpp"
#include "grocery/logging.hpp"
#include "grocery/task_codec.hpp"
#include <grpcpp/grpcpp.h>

namespace inventory {

namespace {

constexpr const char* LOG_DOMAIN = "inventory";

void fill_aisle(grocery::Aisle aisle, const grocery::Ledger::AisleStock& stock,
                grocery::InventorySnapshot* response) {
    auto* entry = response->add_aisles();
    entry->set_aisle(grocery::to_string(aisle));
    for (const auto& [item, qty] : stock) {
        auto* line = entry->add_items();
        line->set_item(item);
        line->set_qty(qty);
    }
}

}  // namespace

class InventoryServiceImpl final : public grocery::InventoryService::Service {
public:
    InventoryServiceImpl(grocery::InventoryCoordinator& coordinator, grocery::Publisher& analytics)
        : coordinator_(coordinator), analytics_(analytics) {}

    grpc::Status ProcessOrder(grpc::ServerContext* context,
                              const grocery::OrderRequest* request,
                              grocery::OrderReply* response) override {
        auto started = std::chrono::steady_clock::now();
        grpc::Status status = grpc::Status::OK;
        try {
            grocery::log_info(LOG_DOMAIN, "order_received",
                {{"message_type", grocery::MessageType_Name(request->message_type())},
                 {"line_items", grocery::helpers::count_items(request->order())}});
            *response = coordinator_.process_order(*request);
        } catch (const std::exception& e) {
            grocery::log_error(LOG_DOMAIN, "order_failed", {{"error", e.what()}});
            status = grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }

        std::chrono::duration<double, std::milli> latency = std::chrono::steady_clock::now() - started;
        emit_analytics(*request, latency.count(), status.ok() && response->code() == grocery::OK);
        return status;
    }

    grpc::Status GetInventory(grpc::ServerContext* context,
                              const grocery::InventoryQuery* request,
                              grocery::InventorySnapshot* response) override {
        if (request->aisle().empty()) {
            for (const auto& [aisle, stock] : coordinator_.ledger().snapshot()) {
                fill_aisle(aisle, stock, response);
            }
            return grpc::Status::OK;
        }

        auto aisle = grocery::parse_aisle(request->aisle());
        if (!aisle) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Unknown aisle: " + request->aisle());
        }
        fill_aisle(*aisle, coordinator_.ledger().snapshot(*aisle), response);
        return grpc::Status::OK;
    }

private:
    void emit_analytics(const grocery::OrderRequest& request, double latency_ms, bool success) {
        auto event = grocery::make_analytics_event(
            LOG_DOMAIN, grocery::MessageType_Name(request.message_type()), latency_ms, success);
        try {
            analytics_.publish(grocery::ANALYTICS_TOPIC, grocery::encode_analytics_event(event));
        } catch (const grocery::GroceryError& e) {
            grocery::log_warn(LOG_DOMAIN, "analytics_publish_failed", {{"error", e.what()}});
        }
    }

    grocery::InventoryCoordinator& coordinator_;
    grocery::Publisher& analytics_;
};

class RobotResultServiceImpl final : public grocery::InventoryRobotService::Service {
public:
    explicit RobotResultServiceImpl(grocery::InventoryCoordinator& coordinator)
        : coordinator_(coordinator) {}

    grpc::Status ReportTaskResult(grpc::ServerContext* context,
                                  const grocery::RobotTaskResult* request,
                                  grocery::RobotAck* response) override {
        try {
            *response = coordinator_.report_result(*request);
            return grpc::Status::OK;
        } catch (const std::exception& e) {
            grocery::log_error(LOG_DOMAIN, "result_intake_failed",
                {{"task_id", request->task_id()}, {"robot_id", request->robot_id()}, {"error", e.what()}});
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
    }

private:
    grocery::InventoryCoordinator& coordinator_;
};

std::unique_ptr<grocery::InventoryService::Service> create_inventory_service(
    grocery::InventoryCoordinator& coordinator, grocery::Publisher& analytics) {
    return std::make_unique<InventoryServiceImpl>(coordinator, analytics);
}

std::unique_ptr<grocery::InventoryRobotService::Service> create_robot_result_service(
    grocery::InventoryCoordinator& coordinator) {
    return std::make_unique<RobotResultServiceImpl>(coordinator);
}

}  // namespace inventory
