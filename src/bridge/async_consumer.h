#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "blocking_bridge.h"
#include "../broker/interfaces.h"

namespace SalKafka {

/**
 * Non-blocking read on top of a blocking consumer client.
 *
 * A read runs a poll loop on the bridge's worker pool until a message
 * arrives. Only one read may be outstanding, so messages reach the driver
 * in the order the client returns them. The poll timeout bounds how long
 * Shutdown takes to stop an outstanding read.
 */
class AsyncConsumer {
public:
    /**
     * Invoked on the driver. On a MessageError the exception_ptr is set;
     * after Shutdown the message is null.
     */
    using ReadHandler = std::function<void(std::exception_ptr, std::unique_ptr<ConsumedMessage>)>;

    AsyncConsumer(BlockingBridge& bridge, IConsumerClient& client, int poll_timeout_ms)
        : bridge_(bridge), client_(client), poll_timeout_ms_(poll_timeout_ms) {}

    /**
     * Subscribe the client to topics on the worker pool; handler receives
     * any subscription error
     */
    void AsyncSubscribe(std::vector<std::string> topics, std::function<void(std::exception_ptr)> handler);

    /**
     * Read the next message
     * @throws Error if a read is already outstanding
     */
    void AsyncRead(ReadHandler handler);

    // Ask an outstanding read to give up at its next poll timeout
    void Shutdown() { shutdown_ = true; }

    bool read_outstanding() const { return read_outstanding_; }

private:
    BlockingBridge& bridge_;
    IConsumerClient& client_;
    int poll_timeout_ms_;
    std::atomic<bool> shutdown_{false};
    // Touched only on the driver
    bool read_outstanding_ = false;
};

} // namespace SalKafka
