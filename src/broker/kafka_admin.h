#pragma once

#include <memory>
#include <string>

#include "interfaces.h"

struct rd_kafka_s;

namespace SalKafka {

/**
 * IAdminClient on top of the librdkafka admin API. Every call blocks the
 * calling thread until the broker answers or the timeout expires.
 */
class KafkaAdminClient : public IAdminClient {
public:
    /**
     * @param bootstrap_servers Broker list, e.g. broker:29092
     * @param timeout_ms Upper bound for every admin request
     * @param message_max_bytes Applied as max.message.bytes to created topics
     * @throws ProvisioningError if the client cannot be created
     */
    KafkaAdminClient(const std::string& bootstrap_servers, int timeout_ms, int message_max_bytes);
    ~KafkaAdminClient() override;

    KafkaAdminClient(const KafkaAdminClient&) = delete;
    KafkaAdminClient& operator=(const KafkaAdminClient&) = delete;

    std::vector<AdminResult> DescribeTopicConfigs(const std::vector<std::string>& names) override;
    std::set<std::string> ListTopics(int timeout_ms) override;
    std::vector<AdminResult> CreateTopics(const std::vector<NewTopicSpec>& specs) override;

private:
    rd_kafka_s* rk_;
    int timeout_ms_;
    int message_max_bytes_;
};

} // namespace SalKafka
