#include "topic_provisioner.h"

#include <set>

#include <glog/logging.h>

#include "../common/errors.h"

namespace SalKafka {

TopicProvisioner::TopicProvisioner(IAdminClient& admin, std::string sentinel_topic,
        int replication_factor, int list_timeout_ms)
    : admin_(admin),
      sentinel_topic_(std::move(sentinel_topic)),
      replication_factor_(replication_factor),
      list_timeout_ms_(list_timeout_ms) {}

ProvisionReport TopicProvisioner::EnsureTopics(const std::vector<std::string>& topics, int partitions) {
    ProvisionReport report;
    const std::set<std::string> needed(topics.begin(), topics.end());

    // 1. Describe-config probe, sentinel included
    std::vector<std::string> probe(needed.begin(), needed.end());
    probe.push_back(sentinel_topic_);
    for (const auto& result : admin_.DescribeTopicConfigs(probe)) {
        if (result.status == AdminStatus::kUnknownTopic) {
            if (result.topic != sentinel_topic_) {
                report.reported_missing.push_back(result.topic);
            }
        } else if (result.status == AdminStatus::kError) {
            LOG(WARNING) << "Unknown issue with topic " << result.topic << ": " << result.error;
        } else if (result.topic == sentinel_topic_) {
            LOG(WARNING) << "Sentinel topic " << sentinel_topic_
                         << " exists; missing-topic detection may be unreliable";
        }
    }

    // 2. Creation set: needed minus what the cluster lists
    const std::set<std::string> existing = admin_.ListTopics(list_timeout_ms_);
    std::vector<NewTopicSpec> specs;
    for (const auto& name : needed) {
        if (existing.count(name) == 0) {
            specs.push_back(NewTopicSpec{name, partitions, replication_factor_});
        }
    }
    if (specs.empty()) {
        VLOG(1) << "All " << needed.size() << " topics already exist";
        return report;
    }

    std::string names;
    for (const auto& spec : specs) names += (names.empty() ? "" : ", ") + spec.name;
    LOG(INFO) << "Create topics: " << names;

    // 3. One batched create; any failure aborts provisioning
    std::string failures;
    for (const auto& result : admin_.CreateTopics(specs)) {
        if (result.status != AdminStatus::kOk) {
            LOG(ERROR) << "Failed to create topic " << result.topic << ": " << result.error;
            failures += (failures.empty() ? "" : "; ") + result.topic + ": " + result.error;
        } else {
            report.created.push_back(result.topic);
        }
    }
    if (!failures.empty()) {
        throw ProvisioningError("Failed to create topics: " + failures);
    }
    return report;
}

} // namespace SalKafka
