#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace SalKafka {

/**
 * Outcome of one per-topic admin request
 */
enum class AdminStatus {
    kOk,
    // The broker does not know the topic
    kUnknownTopic,
    kError,
};

struct AdminResult {
    std::string topic;
    AdminStatus status = AdminStatus::kOk;
    std::string error;
};

struct NewTopicSpec {
    std::string name;
    int partitions = 1;
    int replication_factor = 1;
};

/**
 * Interface for broker topic administration
 */
class IAdminClient {
public:
    virtual ~IAdminClient() = default;

    // One result per requested name, in request order
    virtual std::vector<AdminResult> DescribeTopicConfigs(const std::vector<std::string>& names) = 0;
    // Names of every topic the cluster currently knows
    virtual std::set<std::string> ListTopics(int timeout_ms) = 0;
    // One result per spec, in request order
    virtual std::vector<AdminResult> CreateTopics(const std::vector<NewTopicSpec>& specs) = 0;
};

/**
 * Result of one publish, as reported by the client's delivery callback
 */
struct DeliveryReport {
    std::string topic;
    // 0 on success
    int error_code = 0;
    std::string error;

    bool ok() const { return error_code == 0; }
};

// Invoked exactly once per produced message, on the client's own thread
using DeliveryCallback = std::function<void(const DeliveryReport&)>;

/**
 * Interface for the blocking, thread-affine producer client
 */
class IProducerClient {
public:
    virtual ~IProducerClient() = default;

    /**
     * Enqueue one message. The callback fires from within a later Flush.
     * @throws DeliveryError if the client refuses the message
     */
    virtual void Produce(const std::string& topic, const std::string& payload,
                         DeliveryCallback on_delivery) = 0;

    /**
     * Block until every queued message is delivered or the timeout expires
     * @return Number of messages still outstanding
     */
    virtual int Flush(int timeout_ms) = 0;
};

/**
 * One message returned by IConsumerClient::Poll
 */
struct ConsumedMessage {
    std::string topic;
    std::string payload;
    int32_t partition = -1;
    int64_t offset = -1;
    // Non-zero when the broker attached an error to this message
    int error_code = 0;
    std::string error;

    bool ok() const { return error_code == 0; }
};

/**
 * Interface for the blocking, thread-affine consumer client
 */
class IConsumerClient {
public:
    virtual ~IConsumerClient() = default;

    virtual void Subscribe(const std::vector<std::string>& topics) = 0;

    /**
     * Wait up to timeout_ms for the next message
     * @return nullptr if nothing arrived in time
     */
    virtual std::unique_ptr<ConsumedMessage> Poll(int timeout_ms) = 0;

    virtual void Close() = 0;
};

} // namespace SalKafka
