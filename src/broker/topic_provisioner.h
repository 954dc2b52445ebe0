#pragma once

#include <string>
#include <vector>

#include "interfaces.h"

namespace SalKafka {

struct ProvisionReport {
    // Needed topics the describe-config probe reported as unknown
    std::vector<std::string> reported_missing;
    // Topics created by this call, sorted
    std::vector<std::string> created;
};

/**
 * Makes sure a set of topics exists before any traffic starts.
 *
 * Two checks are combined: a describe-config probe (whose unknown-topic
 * error is the broker's only reliable "does not exist" signal, confirmed
 * against a sentinel name that never exists) and a cluster-wide topic list
 * that decides the set to create. Topics that already exist are left alone,
 * so running this twice creates nothing the second time.
 */
class TopicProvisioner {
public:
    /**
     * @param admin Admin client; must outlive the provisioner
     * @param sentinel_topic Name that never exists on the broker
     * @param replication_factor Replication factor of created topics
     * @param list_timeout_ms Timeout of the topic list request
     */
    TopicProvisioner(IAdminClient& admin, std::string sentinel_topic, int replication_factor,
                     int list_timeout_ms);

    /**
     * @param topics Wire topic names that must exist
     * @param partitions Partition count of created topics
     * @throws ProvisioningError if any creation fails
     */
    ProvisionReport EnsureTopics(const std::vector<std::string>& topics, int partitions);

private:
    IAdminClient& admin_;
    std::string sentinel_topic_;
    int replication_factor_;
    int list_timeout_ms_;
};

} // namespace SalKafka
