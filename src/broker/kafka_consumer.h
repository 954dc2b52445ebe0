#pragma once

#include <memory>
#include <string>

#include "interfaces.h"

namespace RdKafka {
class KafkaConsumer;
}

namespace SalKafka {

/**
 * IConsumerClient backed by RdKafka::KafkaConsumer. Not thread-safe; the
 * bridge confines every call to its worker pool.
 */
class KafkaConsumerClient : public IConsumerClient {
public:
    /**
     * @param bootstrap_servers Broker list
     * @param group_id Consumer group; a fresh one per run starts at the current end
     * @param auto_offset_reset "latest" or "earliest"
     * @throws MessageError if the client cannot be created
     */
    KafkaConsumerClient(const std::string& bootstrap_servers, const std::string& group_id,
                        const std::string& auto_offset_reset);
    ~KafkaConsumerClient() override;

    void Subscribe(const std::vector<std::string>& topics) override;
    std::unique_ptr<ConsumedMessage> Poll(int timeout_ms) override;
    void Close() override;

private:
    std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
    bool closed_ = false;
};

/**
 * Random consumer group id: 12 random bytes, URL-safe base64, with the
 * padding character replaced by '_'
 */
std::string MakeRandomGroupId();

} // namespace SalKafka
