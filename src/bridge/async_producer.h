#pragma once

#include <exception>
#include <functional>
#include <string>

#include "blocking_bridge.h"
#include "../broker/interfaces.h"

namespace SalKafka {

/**
 * Non-blocking publish on top of a blocking producer client.
 *
 * Each publish runs produce + flush on the bridge's worker pool. The
 * delivery callback resolves a std::promise directly from the client's
 * thread, and the worker hands the matching future back to the driver, which
 * checks it without waiting: the flush has already forced the callback.
 */
class AsyncProducer {
public:
    // Invoked on the driver; a null exception_ptr means the broker acknowledged
    using PublishHandler = std::function<void(std::exception_ptr)>;

    /**
     * @param bridge Bridge whose pool is the only user of client
     * @param client Producer client; must outlive this object
     * @param flush_timeout_ms How long a publish may wait for its delivery report
     */
    AsyncProducer(BlockingBridge& bridge, IProducerClient& client, int flush_timeout_ms)
        : bridge_(bridge), client_(client), flush_timeout_ms_(flush_timeout_ms) {}

    /**
     * Publish one message. The handler receives a DeliveryError if the
     * broker reports a failure or no delivery report arrives before the
     * flush timeout.
     */
    void AsyncPublish(std::string topic, std::string payload, PublishHandler handler);

private:
    BlockingBridge& bridge_;
    IProducerClient& client_;
    int flush_timeout_ms_;
};

} // namespace SalKafka
