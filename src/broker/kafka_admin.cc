#include "kafka_admin.h"

#include <map>

#include <glog/logging.h>
#include <librdkafka/rdkafka.h>

#include "../common/errors.h"

namespace SalKafka {

namespace {

struct EventDeleter {
    void operator()(rd_kafka_event_t* event) const { rd_kafka_event_destroy(event); }
};
struct QueueDeleter {
    void operator()(rd_kafka_queue_t* queue) const { rd_kafka_queue_destroy(queue); }
};
struct OptionsDeleter {
    void operator()(rd_kafka_AdminOptions_t* options) const { rd_kafka_AdminOptions_destroy(options); }
};

using EventPtr = std::unique_ptr<rd_kafka_event_t, EventDeleter>;
using QueuePtr = std::unique_ptr<rd_kafka_queue_t, QueueDeleter>;
using OptionsPtr = std::unique_ptr<rd_kafka_AdminOptions_t, OptionsDeleter>;

OptionsPtr MakeOptions(rd_kafka_t* rk, rd_kafka_admin_op_t op, int timeout_ms) {
    char errstr[512];
    OptionsPtr options(rd_kafka_AdminOptions_new(rk, op));
    if (rd_kafka_AdminOptions_set_request_timeout(options.get(), timeout_ms, errstr, sizeof(errstr))
            != RD_KAFKA_RESP_ERR_NO_ERROR) {
        LOG(WARNING) << "Failed to set admin request timeout: " << errstr;
    }
    return options;
}

// Waits for the single result event of an admin request on queue
EventPtr WaitForResult(rd_kafka_queue_t* queue, int timeout_ms, const char* what) {
    // Leave the broker-side timeout room to report before giving up locally
    EventPtr event(rd_kafka_queue_poll(queue, timeout_ms + 1000));
    if (!event) {
        throw ProvisioningError(std::string(what) + " timed out after " +
                std::to_string(timeout_ms) + " ms");
    }
    return event;
}

// Orders per-topic results as the request was ordered
std::vector<AdminResult> InRequestOrder(const std::vector<std::string>& names,
        std::map<std::string, AdminResult>& by_name) {
    std::vector<AdminResult> results;
    results.reserve(names.size());
    for (const auto& name : names) {
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            results.push_back(AdminResult{name, AdminStatus::kError, "no result returned"});
        } else {
            results.push_back(std::move(it->second));
        }
    }
    return results;
}

} // namespace

KafkaAdminClient::KafkaAdminClient(const std::string& bootstrap_servers, int timeout_ms,
        int message_max_bytes)
    : rk_(nullptr), timeout_ms_(timeout_ms), message_max_bytes_(message_max_bytes) {
    char errstr[512];
    rd_kafka_conf_t* conf = rd_kafka_conf_new();
    if (rd_kafka_conf_set(conf, "bootstrap.servers", bootstrap_servers.c_str(), errstr, sizeof(errstr))
            != RD_KAFKA_CONF_OK) {
        rd_kafka_conf_destroy(conf);
        throw ProvisioningError(std::string("Invalid bootstrap.servers: ") + errstr);
    }
    // rd_kafka_new takes ownership of conf on success only
    rk_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
    if (!rk_) {
        rd_kafka_conf_destroy(conf);
        throw ProvisioningError(std::string("Failed to create Kafka admin client: ") + errstr);
    }
}

KafkaAdminClient::~KafkaAdminClient() {
    if (rk_) rd_kafka_destroy(rk_);
}

std::vector<AdminResult> KafkaAdminClient::DescribeTopicConfigs(const std::vector<std::string>& names) {
    std::vector<rd_kafka_ConfigResource_t*> resources;
    resources.reserve(names.size());
    for (const auto& name : names) {
        resources.push_back(rd_kafka_ConfigResource_new(RD_KAFKA_RESOURCE_TOPIC, name.c_str()));
    }

    OptionsPtr options = MakeOptions(rk_, RD_KAFKA_ADMIN_OP_DESCRIBECONFIGS, timeout_ms_);
    QueuePtr queue(rd_kafka_queue_new(rk_));
    rd_kafka_DescribeConfigs(rk_, resources.data(), resources.size(), options.get(), queue.get());
    rd_kafka_ConfigResource_destroy_array(resources.data(), resources.size());

    EventPtr event = WaitForResult(queue.get(), timeout_ms_, "DescribeConfigs");

    std::map<std::string, AdminResult> by_name;
    if (rd_kafka_event_error(event.get()) != RD_KAFKA_RESP_ERR_NO_ERROR) {
        const std::string error = rd_kafka_event_error_string(event.get());
        for (const auto& name : names) {
            by_name[name] = AdminResult{name, AdminStatus::kError, error};
        }
        return InRequestOrder(names, by_name);
    }

    const rd_kafka_DescribeConfigs_result_t* result = rd_kafka_event_DescribeConfigs_result(event.get());
    size_t count = 0;
    const rd_kafka_ConfigResource_t** described =
            rd_kafka_DescribeConfigs_result_resources(result, &count);
    for (size_t i = 0; i < count; ++i) {
        AdminResult r;
        r.topic = rd_kafka_ConfigResource_name(described[i]);
        rd_kafka_resp_err_t err = rd_kafka_ConfigResource_error(described[i]);
        if (err == RD_KAFKA_RESP_ERR_UNKNOWN_TOPIC_OR_PART) {
            r.status = AdminStatus::kUnknownTopic;
        } else if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            r.status = AdminStatus::kError;
        }
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            const char* errstr = rd_kafka_ConfigResource_error_string(described[i]);
            r.error = errstr ? errstr : rd_kafka_err2str(err);
        }
        by_name[r.topic] = std::move(r);
    }
    return InRequestOrder(names, by_name);
}

std::set<std::string> KafkaAdminClient::ListTopics(int timeout_ms) {
    const struct rd_kafka_metadata* metadata = nullptr;
    rd_kafka_resp_err_t err = rd_kafka_metadata(rk_, 1, nullptr, &metadata, timeout_ms);
    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        throw ProvisioningError(std::string("Failed to list topics: ") + rd_kafka_err2str(err));
    }
    std::set<std::string> topics;
    for (int i = 0; i < metadata->topic_cnt; ++i) {
        topics.insert(metadata->topics[i].topic);
    }
    rd_kafka_metadata_destroy(metadata);
    return topics;
}

std::vector<AdminResult> KafkaAdminClient::CreateTopics(const std::vector<NewTopicSpec>& specs) {
    char errstr[512];
    const std::string max_message_bytes = std::to_string(message_max_bytes_);
    std::vector<rd_kafka_NewTopic_t*> new_topics;
    std::vector<std::string> names;
    new_topics.reserve(specs.size());
    names.reserve(specs.size());
    for (const auto& spec : specs) {
        rd_kafka_NewTopic_t* new_topic = rd_kafka_NewTopic_new(spec.name.c_str(), spec.partitions,
                spec.replication_factor, errstr, sizeof(errstr));
        if (!new_topic) {
            rd_kafka_NewTopic_destroy_array(new_topics.data(), new_topics.size());
            throw ProvisioningError("Invalid topic spec for " + spec.name + ": " + errstr);
        }
        if (rd_kafka_NewTopic_set_config(new_topic, "max.message.bytes", max_message_bytes.c_str())
                != RD_KAFKA_RESP_ERR_NO_ERROR) {
            LOG(WARNING) << "Failed to set max.message.bytes on " << spec.name;
        }
        new_topics.push_back(new_topic);
        names.push_back(spec.name);
    }

    OptionsPtr options = MakeOptions(rk_, RD_KAFKA_ADMIN_OP_CREATETOPICS, timeout_ms_);
    QueuePtr queue(rd_kafka_queue_new(rk_));
    rd_kafka_CreateTopics(rk_, new_topics.data(), new_topics.size(), options.get(), queue.get());
    rd_kafka_NewTopic_destroy_array(new_topics.data(), new_topics.size());

    EventPtr event = WaitForResult(queue.get(), timeout_ms_, "CreateTopics");

    std::map<std::string, AdminResult> by_name;
    if (rd_kafka_event_error(event.get()) != RD_KAFKA_RESP_ERR_NO_ERROR) {
        const std::string error = rd_kafka_event_error_string(event.get());
        for (const auto& name : names) {
            by_name[name] = AdminResult{name, AdminStatus::kError, error};
        }
        return InRequestOrder(names, by_name);
    }

    const rd_kafka_CreateTopics_result_t* result = rd_kafka_event_CreateTopics_result(event.get());
    size_t count = 0;
    const rd_kafka_topic_result_t** topics = rd_kafka_CreateTopics_result_topics(result, &count);
    for (size_t i = 0; i < count; ++i) {
        AdminResult r;
        r.topic = rd_kafka_topic_result_name(topics[i]);
        rd_kafka_resp_err_t err = rd_kafka_topic_result_error(topics[i]);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            r.status = AdminStatus::kError;
            const char* errstr_result = rd_kafka_topic_result_error_string(topics[i]);
            r.error = errstr_result ? errstr_result : rd_kafka_err2str(err);
        }
        by_name[r.topic] = std::move(r);
    }
    return InRequestOrder(names, by_name);
}

} // namespace SalKafka
