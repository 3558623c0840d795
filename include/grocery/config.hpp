#pragma once

#include <chrono>
#include <string>
#include "catalog.hpp"

namespace grocery {

/**
 * Environment lookups with defaults.
 *
 * Numeric readers throw InvalidArgumentError when a variable is set but
 * does not parse, so a typo fails the process at startup instead of
 * silently running with the default.
 */
namespace config {

std::string env_or(const std::string& name, const std::string& fallback);

long env_long(const std::string& name, long fallback);

double env_double(const std::string& name, double fallback);

} // namespace config

struct CoordinatorConfig {
    std::chrono::milliseconds barrier_timeout{10000};
    int expected_robots = 5;

    /**
     * @throws InvalidArgumentError on a non-positive timeout or robot count
     */
    void validate() const;
};

struct InventoryConfig {
    std::string listen_address = "0.0.0.0:50051";
    std::string zmq_pub_address = "tcp://*:5556";
    std::string pricing_address = "localhost:50052";
    double initial_stock = 100.0;
    int rpc_max_threads = 64;
    CoordinatorConfig coordinator;

    /**
     * Read INVENTORY_LISTEN_ADDR, INVENTORY_ZMQ_PUB, PRICING_GRPC_ADDR,
     * BARRIER_TIMEOUT_MS, EXPECTED_ROBOTS, INITIAL_STOCK and RPC_MAX_THREADS.
     */
    static InventoryConfig from_env();

    void validate() const;
};

struct RobotConfig {
    std::string robot_id;
    Aisle aisle = Aisle::Bread;
    std::string inventory_address = "localhost:50051";
    std::string zmq_sub_address = "tcp://localhost:5556";
    std::chrono::milliseconds work_time{1000};

    /**
     * argv: <aisle> [robot_id]. Addresses and work time come from
     * INVENTORY_GRPC_ADDR, INVENTORY_ZMQ_SUB and ROBOT_WORK_MS.
     */
    static RobotConfig from_args(int argc, char** argv);
};

struct OrderClientConfig {
    /// Time the reply may take beyond the inventory's barrier timeout.
    static constexpr std::chrono::milliseconds DEADLINE_MARGIN{10000};

    std::string inventory_address = "localhost:50051";
    std::chrono::milliseconds call_deadline{20000};

    /**
     * INVENTORY_GRPC_ADDR, and BARRIER_TIMEOUT_MS so the call outlasts the
     * barrier it waits on.
     *
     * @throws InvalidArgumentError on a malformed or non-positive timeout
     */
    static OrderClientConfig from_env();
};

} // namespace grocery
