#include "grocery/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include "grocery/errors.hpp"

namespace grocery {

namespace config {

std::string env_or(const std::string& name, const std::string& fallback) {
    const char* value = std::getenv(name.c_str());
    return value && *value ? value : fallback;
}

long env_long(const std::string& name, long fallback) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) return fallback;

    std::size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != std::string(value).size()) {
        throw InvalidArgumentError(name + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

double env_double(const std::string& name, double fallback) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) return fallback;

    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != std::string(value).size()) {
        throw InvalidArgumentError(name + " must be a number, got '" + value + "'");
    }
    return parsed;
}

} // namespace config

void CoordinatorConfig::validate() const {
    if (barrier_timeout.count() <= 0) {
        throw InvalidArgumentError("barrier timeout must be positive");
    }
    if (expected_robots < 1) {
        throw InvalidArgumentError("expected robot count must be at least 1");
    }
}

InventoryConfig InventoryConfig::from_env() {
    InventoryConfig cfg;
    cfg.listen_address = config::env_or("INVENTORY_LISTEN_ADDR", cfg.listen_address);
    cfg.zmq_pub_address = config::env_or("INVENTORY_ZMQ_PUB", cfg.zmq_pub_address);
    cfg.pricing_address = config::env_or("PRICING_GRPC_ADDR", cfg.pricing_address);
    cfg.initial_stock = config::env_double("INITIAL_STOCK", cfg.initial_stock);
    cfg.rpc_max_threads = static_cast<int>(config::env_long("RPC_MAX_THREADS", cfg.rpc_max_threads));
    cfg.coordinator.barrier_timeout = std::chrono::milliseconds(
        config::env_long("BARRIER_TIMEOUT_MS", cfg.coordinator.barrier_timeout.count()));
    cfg.coordinator.expected_robots =
        static_cast<int>(config::env_long("EXPECTED_ROBOTS", cfg.coordinator.expected_robots));
    cfg.validate();
    return cfg;
}

void InventoryConfig::validate() const {
    coordinator.validate();
    if (initial_stock < 0) {
        throw InvalidArgumentError("INITIAL_STOCK must be non-negative");
    }
    // Each in-flight order pins a handler thread for the whole barrier wait;
    // robots need spare threads to report into.
    if (rpc_max_threads < 2) {
        throw InvalidArgumentError("RPC_MAX_THREADS must be at least 2");
    }
}

RobotConfig RobotConfig::from_args(int argc, char** argv) {
    if (argc < 2) {
        throw InvalidArgumentError("usage: grocery_robot <aisle> [robot_id]");
    }

    auto aisle = parse_aisle(argv[1]);
    if (!aisle) {
        throw InvalidArgumentError(std::string("unknown aisle '") + argv[1] + "'");
    }

    RobotConfig cfg;
    cfg.aisle = *aisle;
    cfg.robot_id = argc > 2 ? argv[2] : "robot_" + to_string(*aisle);
    cfg.inventory_address = config::env_or("INVENTORY_GRPC_ADDR", cfg.inventory_address);
    cfg.zmq_sub_address = config::env_or("INVENTORY_ZMQ_SUB", cfg.zmq_sub_address);
    cfg.work_time = std::chrono::milliseconds(config::env_long("ROBOT_WORK_MS", cfg.work_time.count()));
    if (cfg.work_time.count() < 0) {
        throw InvalidArgumentError("ROBOT_WORK_MS must be non-negative");
    }
    return cfg;
}

OrderClientConfig OrderClientConfig::from_env() {
    OrderClientConfig cfg;
    cfg.inventory_address = config::env_or("INVENTORY_GRPC_ADDR", cfg.inventory_address);

    CoordinatorConfig barrier;
    barrier.barrier_timeout = std::chrono::milliseconds(
        config::env_long("BARRIER_TIMEOUT_MS", barrier.barrier_timeout.count()));
    barrier.validate();
    cfg.call_deadline = barrier.barrier_timeout + DEADLINE_MARGIN;
    return cfg;
}

} // namespace grocery
