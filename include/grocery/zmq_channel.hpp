#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <zmq.hpp>
#include "publisher.hpp"

namespace grocery {

/// One two-part broadcast frame: [topic, payload].
struct BroadcastFrame {
    std::string topic;
    std::string payload;
};

/**
 * Publisher over a bound ZeroMQ PUB socket.
 *
 * ZeroMQ sockets are not thread-safe; publish() serializes callers, since
 * every in-flight order publishes from its own RPC thread.
 */
class ZmqPublisher : public Publisher {
public:
    /**
     * @throws ConnectionError if the address cannot be bound
     */
    explicit ZmqPublisher(const std::string& bind_address);

    /**
     * @throws TransportError if ZeroMQ refuses the frame
     */
    void publish(const std::string& topic, const std::string& payload) override;

private:
    zmq::context_t context_;
    zmq::socket_t socket_;
    std::mutex mutex_;
};

/**
 * SUB socket connected to a publisher and filtered to a set of topics.
 */
class ZmqSubscriber {
public:
    /**
     * @throws ConnectionError if the address cannot be connected
     */
    ZmqSubscriber(const std::string& connect_address, const std::vector<std::string>& topics,
                  std::chrono::milliseconds receive_timeout = std::chrono::milliseconds(1000));

    /**
     * Wait up to the receive timeout for the next frame.
     *
     * @return nullopt on timeout
     * @throws TransportError if the socket fails
     */
    std::optional<BroadcastFrame> receive();

private:
    zmq::context_t context_;
    zmq::socket_t socket_;
};

} // namespace grocery
