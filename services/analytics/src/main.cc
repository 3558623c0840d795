#include "grocery/analytics.hpp"
#include "grocery/config.hpp"
#include "grocery/errors.hpp"
#include "grocery/logging.hpp"
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
    std::string address = grocery::config::env_or("ANALYTICS_ZMQ_SUB", "tcp://localhost:5556");

    std::signal(SIGINT, stop);
    std::signal(SIGTERM, stop);

    std::unique_ptr<grocery::ZmqSubscriber> subscriber;
    try {
        subscriber = std::make_unique<grocery::ZmqSubscriber>(
            address, std::vector<std::string>{grocery::ANALYTICS_TOPIC});
    } catch (const grocery::GroceryError& e) {
        grocery::log_error("analytics", "subscribe_failed", {{"error", e.what()}});
        return 1;
    }

    grocery::log_info("analytics", "analytics_started", {{"zmq_sub", address}});

    grocery::AnalyticsCollector collector;
    while (running) {
        try {
            auto frame = subscriber->receive();
            if (!frame) continue;

            auto event = grocery::decode_analytics_event(frame->payload);
            grocery::log_info("analytics", "event_received",
                {{"event_id", event.event_id()},
                 {"source", event.source()},
                 {"event_type", event.event_type()},
                 {"latency_ms", event.latency_ms()},
                 {"success", event.success()}});

            collector.record(event);
            grocery::log_info("analytics", "summary", collector.summary());
        } catch (const grocery::DecodeError& e) {
            grocery::log_warn("analytics", "event_decode_failed", {{"error", e.what()}});
        } catch (const grocery::TransportError& e) {
            grocery::log_error("analytics", "receive_failed", {{"error", e.what()}});
        }
    }

    grocery::log_info("analytics", "analytics_stopped", collector.summary());
    return 0;
}
