#pragma once

#include <functional>
#include <string>
#include <vector>

#include "../bridge/blocking_bridge.h"
#include "../broker/topic_provisioner.h"
#include "../metadata/topic_descriptor.h"
#include "../registry/schema_registrar.h"

namespace SalKafka {

/**
 * Look up topics by logical name
 * @throws ConfigurationError naming the first unknown topic
 */
std::vector<const TopicDescriptor*> SelectTopics(const ComponentDescriptor& component,
		const std::vector<std::string>& logical_names);

/**
 * Names of fields the Avro decoder cannot read back (map fields). A reader
 * subscribed to such a topic fails on its first message.
 */
std::vector<std::string> UndecodableFields(const TopicDescriptor& topic);

/**
 * The network half of startup, run on the driver before any pipeline:
 * register every topic's schema, one after another, then provision the
 * topics. Each blocking step runs on the admin bridge.
 */
class Startup {
public:
	using ReadyHandler = std::function<void(const RegistrationMap&)>;

	Startup(BlockingBridge& admin_bridge, SchemaRegistrar& registrar, TopicProvisioner& provisioner)
		: admin_bridge_(admin_bridge), registrar_(registrar), provisioner_(provisioner) {}

	/**
	 * @param partitions Partition count of any topic that has to be created
	 * @param ready Runs on the driver once every topic is registered and exists
	 */
	void Run(std::vector<const TopicDescriptor*> topics, int partitions, ReadyHandler ready);

private:
	BlockingBridge& admin_bridge_;
	SchemaRegistrar& registrar_;
	TopicProvisioner& provisioner_;
};

} // namespace SalKafka
