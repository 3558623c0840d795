#include "grocery/config.hpp"
#include "grocery/errors.hpp"
#include "grocery/logging.hpp"
#include "grocery/robot.hpp"
#include "grocery/task_codec.hpp"
#include "grocery/zmq_channel.hpp"
#include <atomic>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

namespace {

std::atomic<bool> running{true};

void stop(int) {
    running = false;
}

}  // namespace

int main(int argc, char** argv) {
    grocery::RobotConfig config;
    try {
        config = grocery::RobotConfig::from_args(argc, argv);
    } catch (const grocery::GroceryError& e) {
        grocery::log_error("robot", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }

    std::signal(SIGINT, stop);
    std::signal(SIGTERM, stop);

    auto reporter = grocery::GrpcResultReporter::connect(config.inventory_address);
    grocery::RobotWorker worker(config.robot_id, config.aisle, *reporter, config.work_time);

    std::unique_ptr<grocery::ZmqSubscriber> subscriber;
    try {
        subscriber = std::make_unique<grocery::ZmqSubscriber>(
            config.zmq_sub_address,
            std::vector<std::string>{grocery::FETCH_TOPIC, grocery::RESTOCK_TOPIC});
    } catch (const grocery::GroceryError& e) {
        grocery::log_error("robot", "subscribe_failed", {{"error", e.what()}});
        return 1;
    }

    grocery::log_info("robot", "robot_started",
        {{"robot_id", config.robot_id},
         {"aisle", grocery::to_string(config.aisle)},
         {"zmq_sub", config.zmq_sub_address},
         {"inventory", config.inventory_address}});

    while (running) {
        try {
            auto frame = subscriber->receive();
            if (frame) {
                worker.handle(frame->topic, frame->payload);
            }
        } catch (const grocery::TransportError& e) {
            grocery::log_error("robot", "receive_failed", {{"error", e.what()}});
        }
    }

    grocery::log_info("robot", "robot_stopped", {{"robot_id", config.robot_id}});
    return 0;
}
