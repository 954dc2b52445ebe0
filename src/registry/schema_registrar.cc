#include "schema_registrar.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace SalKafka {

struct SchemaRegistrar::Pending {
    std::vector<const TopicDescriptor*> topics;
    size_t next = 0;
    RegistrationMap registrations;
    DoneHandler done;
};

SchemaRegistration SchemaRegistrar::Register(const TopicDescriptor& topic) {
    if (!topic.schema) {
        throw RegistryError("topic " + topic.logical_name + " has no schema");
    }
    SchemaRegistration registration;
    registration.subject = topic.subject;
    registration.schema_id = registry_.RegisterSchema(topic.subject, *topic.schema);
    LOG(INFO) << "Registered schema with subject=" << registration.subject
              << " with ID " << registration.schema_id;
    return registration;
}

void SchemaRegistrar::AsyncRegisterAll(BlockingBridge& bridge,
        std::vector<const TopicDescriptor*> topics, DoneHandler done) {
    auto pending = std::make_shared<Pending>();
    pending->topics = std::move(topics);
    pending->done = std::move(done);
    RegisterNext(bridge, std::move(pending));
}

void SchemaRegistrar::RegisterNext(BlockingBridge& bridge, std::shared_ptr<Pending> pending) {
    if (pending->next == pending->topics.size()) {
        // Deliver from the driver even when there was nothing to register
        boost::asio::post(bridge.io_context(), [pending]() {
            pending->done(nullptr, std::move(pending->registrations));
        });
        return;
    }
    const TopicDescriptor* topic = pending->topics[pending->next];
    bridge.Dispatch(
        [this, topic]() { return Register(*topic); },
        [this, &bridge, pending, topic](std::exception_ptr error, SchemaRegistration registration) {
            if (error) {
                pending->done(error, RegistrationMap{});
                return;
            }
            pending->registrations[topic->logical_name] = std::move(registration);
            ++pending->next;
            RegisterNext(bridge, pending);
        });
}

} // namespace SalKafka
