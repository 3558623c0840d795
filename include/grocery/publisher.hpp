#pragma once

#include <string>

namespace grocery {

/**
 * One-directional, topic-tagged broadcast. Subscribers filter by topic.
 */
class Publisher {
public:
    virtual ~Publisher() = default;

    /**
     * Send one frame to every subscriber of the topic.
     *
     * @throws TransportError if the frame could not be handed to the transport
     */
    virtual void publish(const std::string& topic, const std::string& payload) = 0;
};

} // namespace grocery
