#include "inventory_service.hpp"
#include "grocery/catalog.hpp"
#include "grocery/config.hpp"
#include "grocery/coordinator.hpp"
#include "grocery/errors.hpp"
#include "grocery/logging.hpp"
#include "grocery/pricing.hpp"
#include "grocery/zmq_channel.hpp"
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/resource_quota.h>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    grocery::InventoryConfig config;
    try {
        config = grocery::InventoryConfig::from_env();
    } catch (const grocery::GroceryError& e) {
        grocery::log_error("inventory", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }

    std::unique_ptr<grocery::ZmqPublisher> publisher;
    try {
        publisher = std::make_unique<grocery::ZmqPublisher>(config.zmq_pub_address);
    } catch (const grocery::GroceryError& e) {
        grocery::log_error("inventory", "publisher_bind_failed", {{"error", e.what()}});
        return 1;
    }

    auto pricing = grocery::GrpcPricingClient::connect(config.pricing_address);
    grocery::InventoryCoordinator coordinator(config.coordinator, *publisher, *pricing,
                                              grocery::Catalog::standard(), config.initial_stock);

    auto inventory_service = inventory::create_inventory_service(coordinator, *publisher);
    auto robot_service = inventory::create_robot_result_service(coordinator);

    grpc::EnableDefaultHealthCheckService(true);
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    // Every in-flight order holds a handler thread for its whole barrier wait.
    grpc::ResourceQuota quota("inventory");
    quota.SetMaxThreads(config.rpc_max_threads);

    grpc::ServerBuilder builder;
    builder.SetResourceQuota(quota);
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(inventory_service.get());
    builder.RegisterService(robot_service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        grocery::log_error("inventory", "server_start_failed", {{"address", config.listen_address}});
        return 1;
    }

    grocery::log_info("inventory", "inventory_server_started",
        {{"address", config.listen_address},
         {"zmq_pub", config.zmq_pub_address},
         {"pricing", config.pricing_address},
         {"expected_robots", config.coordinator.expected_robots},
         {"barrier_timeout_ms", config.coordinator.barrier_timeout.count()}});

    server->Wait();

    return 0;
}
