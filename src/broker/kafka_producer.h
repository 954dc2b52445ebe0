#pragma once

#include <memory>
#include <string>

#include "interfaces.h"

namespace RdKafka {
class Producer;
}

namespace SalKafka {

class DeliveryDispatcher;

/**
 * IProducerClient backed by RdKafka::Producer. Not thread-safe; the bridge
 * confines every call to its worker pool.
 */
class KafkaProducerClient : public IProducerClient {
public:
    /**
     * @param bootstrap_servers Broker list
     * @param acks "0" to skip broker acknowledgement, "1" to wait for the leader
     * @param message_max_bytes Largest message the client will send
     * @throws DeliveryError if the client cannot be created
     */
    KafkaProducerClient(const std::string& bootstrap_servers, const std::string& acks,
                        int message_max_bytes);
    ~KafkaProducerClient() override;

    void Produce(const std::string& topic, const std::string& payload,
                 DeliveryCallback on_delivery) override;
    int Flush(int timeout_ms) override;

private:
    // Must outlive producer_, which holds a raw pointer to it
    std::unique_ptr<DeliveryDispatcher> dispatcher_;
    std::unique_ptr<RdKafka::Producer> producer_;
};

} // namespace SalKafka
