#include "grocery/logging.hpp"
#include "grocery/pricing.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

namespace pricing {
std::unique_ptr<grocery::PricingService::Service> create_pricing_service();
}

namespace {
constexpr const char* DEFAULT_PORT = "50052";
}

int main(int argc, char** argv) {
    std::string port = argc > 1 ? argv[1] : DEFAULT_PORT;
    std::string server_address = "0.0.0.0:" + port;

    grpc::EnableDefaultHealthCheckService(true);

    auto service = pricing::create_pricing_service();

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        grocery::log_error("pricing", "server_start_failed", {{"address", server_address}});
        return 1;
    }

    grocery::log_info("pricing", "pricing_server_started", {{"port", port}});

    server->Wait();

    return 0;
}
