#include "startup.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace SalKafka {

std::vector<const TopicDescriptor*> SelectTopics(const ComponentDescriptor& component,
		const std::vector<std::string>& logical_names) {
	std::vector<const TopicDescriptor*> topics;
	for (const auto& name : logical_names) {
		auto it = component.topics.find(name);
		if (it == component.topics.end()) {
			std::string known;
			for (const auto& [logical_name, topic] : component.topics) {
				known += (known.empty() ? "" : ", ") + logical_name;
			}
			throw ConfigurationError("Component " + component.name + " has no topic " + name +
					"; topics = [" + known + "]");
		}
		topics.push_back(&it->second);
	}
	return topics;
}

std::vector<std::string> UndecodableFields(const TopicDescriptor& topic) {
	std::vector<std::string> names;
	for (const auto& field : topic.fields) {
		if (field.type == FieldType::kMap) names.push_back(field.name);
	}
	return names;
}

void Startup::Run(std::vector<const TopicDescriptor*> topics, int partitions, ReadyHandler ready) {
	std::vector<std::string> wire_names;
	for (const auto* topic : topics) wire_names.push_back(topic->wire_name);

	registrar_.AsyncRegisterAll(admin_bridge_, std::move(topics),
		[this, wire_names, partitions, ready = std::move(ready)](std::exception_ptr error,
																 RegistrationMap registrations) {
			if (error) {
				std::rethrow_exception(error);
			}
			admin_bridge_.Dispatch(
				[this, wire_names, partitions]() { return provisioner_.EnsureTopics(wire_names, partitions); },
				[ready, registrations = std::move(registrations)](std::exception_ptr error,
																  ProvisionReport report) {
					if (error) {
						std::rethrow_exception(error);
					}
					if (!report.created.empty()) {
						LOG(INFO) << "Created " << report.created.size() << " topics";
					}
					ready(registrations);
				});
		});
}

} // namespace SalKafka
