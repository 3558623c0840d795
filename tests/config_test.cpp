#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "grocery/config.hpp"
#include "grocery/errors.hpp"

using namespace grocery;
using namespace std::chrono_literals;

namespace {

const char* const INVENTORY_VARS[] = {
    "INVENTORY_LISTEN_ADDR", "INVENTORY_ZMQ_PUB", "PRICING_GRPC_ADDR", "INITIAL_STOCK",
    "RPC_MAX_THREADS", "BARRIER_TIMEOUT_MS", "EXPECTED_ROBOTS",
    "INVENTORY_GRPC_ADDR", "INVENTORY_ZMQ_SUB", "ROBOT_WORK_MS"};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : INVENTORY_VARS) unsetenv(name);
    }

    // argv as main() receives it
    static RobotConfig robot_from(std::vector<std::string> args) {
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(arg.data());
        return RobotConfig::from_args(static_cast<int>(argv.size()), argv.data());
    }
};

} // anonymous namespace

// =============================================================================
// Inventory Config Tests
// =============================================================================

TEST_F(ConfigTest, InventoryFromEnv_Unset_ShouldUseDefaults) {
    auto cfg = InventoryConfig::from_env();

    EXPECT_EQ(cfg.listen_address, "0.0.0.0:50051");
    EXPECT_EQ(cfg.zmq_pub_address, "tcp://*:5556");
    EXPECT_EQ(cfg.pricing_address, "localhost:50052");
    EXPECT_DOUBLE_EQ(cfg.initial_stock, 100.0);
    EXPECT_EQ(cfg.rpc_max_threads, 64);
    EXPECT_EQ(cfg.coordinator.barrier_timeout, 10000ms);
    EXPECT_EQ(cfg.coordinator.expected_robots, 5);
}

TEST_F(ConfigTest, InventoryFromEnv_Overrides_ShouldApply) {
    setenv("PRICING_GRPC_ADDR", "pricing:6000", 1);
    setenv("BARRIER_TIMEOUT_MS", "250", 1);
    setenv("EXPECTED_ROBOTS", "3", 1);
    setenv("INITIAL_STOCK", "12.5", 1);

    auto cfg = InventoryConfig::from_env();

    EXPECT_EQ(cfg.pricing_address, "pricing:6000");
    EXPECT_EQ(cfg.coordinator.barrier_timeout, 250ms);
    EXPECT_EQ(cfg.coordinator.expected_robots, 3);
    EXPECT_DOUBLE_EQ(cfg.initial_stock, 12.5);
}

TEST_F(ConfigTest, InventoryFromEnv_MalformedNumber_ShouldThrow) {
    setenv("BARRIER_TIMEOUT_MS", "10s", 1);

    EXPECT_THROW(InventoryConfig::from_env(), InvalidArgumentError);
}

TEST_F(ConfigTest, InventoryFromEnv_OutOfRangeValues_ShouldThrow) {
    setenv("EXPECTED_ROBOTS", "0", 1);
    EXPECT_THROW(InventoryConfig::from_env(), InvalidArgumentError);

    setenv("EXPECTED_ROBOTS", "5", 1);
    setenv("RPC_MAX_THREADS", "1", 1);
    EXPECT_THROW(InventoryConfig::from_env(), InvalidArgumentError);

    setenv("RPC_MAX_THREADS", "8", 1);
    setenv("INITIAL_STOCK", "-1", 1);
    EXPECT_THROW(InventoryConfig::from_env(), InvalidArgumentError);
}

TEST_F(ConfigTest, EnvOr_EmptyValue_ShouldFallBack) {
    setenv("INVENTORY_LISTEN_ADDR", "", 1);

    EXPECT_EQ(config::env_or("INVENTORY_LISTEN_ADDR", "0.0.0.0:1"), "0.0.0.0:1");
}

// =============================================================================
// Order Client Config Tests
// =============================================================================

TEST_F(ConfigTest, OrderClientFromEnv_Unset_ShouldWaitTwentySeconds) {
    auto cfg = OrderClientConfig::from_env();

    EXPECT_EQ(cfg.inventory_address, "localhost:50051");
    EXPECT_EQ(cfg.call_deadline, 20000ms);
}

TEST_F(ConfigTest, OrderClientFromEnv_LongBarrier_ShouldOutlastIt) {
    setenv("BARRIER_TIMEOUT_MS", "60000", 1);

    auto cfg = OrderClientConfig::from_env();

    EXPECT_EQ(cfg.call_deadline, 70000ms);
}

TEST_F(ConfigTest, OrderClientFromEnv_BadBarrier_ShouldThrow) {
    setenv("BARRIER_TIMEOUT_MS", "0", 1);

    EXPECT_THROW(OrderClientConfig::from_env(), InvalidArgumentError);
}

// =============================================================================
// Robot Config Tests
// =============================================================================

TEST_F(ConfigTest, RobotFromArgs_AisleOnly_ShouldDeriveRobotId) {
    auto cfg = robot_from({"grocery_robot", "dairy"});

    EXPECT_EQ(cfg.aisle, Aisle::Dairy);
    EXPECT_EQ(cfg.robot_id, "robot_dairy");
    EXPECT_EQ(cfg.inventory_address, "localhost:50051");
    EXPECT_EQ(cfg.zmq_sub_address, "tcp://localhost:5556");
    EXPECT_EQ(cfg.work_time, 1000ms);
}

TEST_F(ConfigTest, RobotFromArgs_ExplicitIdAndEnv_ShouldApply) {
    setenv("ROBOT_WORK_MS", "0", 1);
    setenv("INVENTORY_GRPC_ADDR", "inventory:50051", 1);

    auto cfg = robot_from({"grocery_robot", "meat", "butcher_1"});

    EXPECT_EQ(cfg.robot_id, "butcher_1");
    EXPECT_EQ(cfg.work_time, 0ms);
    EXPECT_EQ(cfg.inventory_address, "inventory:50051");
}

TEST_F(ConfigTest, RobotFromArgs_MissingOrUnknownAisle_ShouldThrow) {
    EXPECT_THROW(robot_from({"grocery_robot"}), InvalidArgumentError);
    EXPECT_THROW(robot_from({"grocery_robot", "frozen"}), InvalidArgumentError);

    setenv("ROBOT_WORK_MS", "-5", 1);
    EXPECT_THROW(robot_from({"grocery_robot", "bread"}), InvalidArgumentError);
}
