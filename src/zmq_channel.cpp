#include "grocery/zmq_channel.hpp"

#include "grocery/errors.hpp"

namespace grocery {

ZmqPublisher::ZmqPublisher(const std::string& bind_address)
    : context_(1), socket_(context_, zmq::socket_type::pub) {
    try {
        socket_.bind(bind_address);
    } catch (const zmq::error_t& e) {
        throw ConnectionError("Failed to bind " + bind_address + ": " + e.what());
    }
}

void ZmqPublisher::publish(const std::string& topic, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto sent = socket_.send(zmq::buffer(topic), zmq::send_flags::sndmore);
        if (sent) {
            sent = socket_.send(zmq::buffer(payload), zmq::send_flags::none);
        }
        if (!sent) {
            throw TransportError("Publisher would block on topic " + topic);
        }
    } catch (const zmq::error_t& e) {
        throw TransportError("Failed to publish on topic " + topic + ": " + e.what());
    }
}

ZmqSubscriber::ZmqSubscriber(const std::string& connect_address,
                             const std::vector<std::string>& topics,
                             std::chrono::milliseconds receive_timeout)
    : context_(1), socket_(context_, zmq::socket_type::sub) {
    try {
        socket_.set(zmq::sockopt::rcvtimeo, static_cast<int>(receive_timeout.count()));
        socket_.connect(connect_address);
        for (const auto& topic : topics) {
            socket_.set(zmq::sockopt::subscribe, topic);
        }
    } catch (const zmq::error_t& e) {
        throw ConnectionError("Failed to subscribe to " + connect_address + ": " + e.what());
    }
}

std::optional<BroadcastFrame> ZmqSubscriber::receive() {
    try {
        zmq::message_t topic;
        if (!socket_.recv(topic, zmq::recv_flags::none)) {
            return std::nullopt;
        }

        BroadcastFrame frame;
        frame.topic = topic.to_string();
        // Single-part frames carry no payload; hand them on with an empty one.
        if (socket_.get(zmq::sockopt::rcvmore)) {
            zmq::message_t payload;
            if (!socket_.recv(payload, zmq::recv_flags::none)) {
                throw TransportError("Frame on topic " + frame.topic + " lost its payload");
            }
            frame.payload = payload.to_string();
        }
        return frame;
    } catch (const zmq::error_t& e) {
        throw TransportError(std::string("Failed to receive: ") + e.what());
    }
}

} // namespace grocery
