#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "schema_registry.h"
#include "../bridge/blocking_bridge.h"
#include "../metadata/topic_descriptor.h"

namespace SalKafka {

struct SchemaRegistration {
    std::string subject;
    int32_t schema_id = 0;
};

// Keyed by topic logical name
using RegistrationMap = std::map<std::string, SchemaRegistration>;

/**
 * Binds every topic's schema to a registry id before any traffic.
 * Topics are registered one at a time, in the order given; each id is
 * obtained once and reused for the rest of the run.
 */
class SchemaRegistrar {
public:
    using DoneHandler = std::function<void(std::exception_ptr, RegistrationMap)>;

    // registry must outlive the registrar
    explicit SchemaRegistrar(ISchemaRegistry& registry) : registry_(registry) {}

    // Blocking registration of one topic under its subject
    SchemaRegistration Register(const TopicDescriptor& topic);

    /**
     * Register topics sequentially, each call on the bridge's pool.
     * done runs on the driver after the last registration, or after the
     * first failure with the error set.
     */
    void AsyncRegisterAll(BlockingBridge& bridge, std::vector<const TopicDescriptor*> topics,
                          DoneHandler done);

private:
    struct Pending;
    void RegisterNext(BlockingBridge& bridge, std::shared_ptr<Pending> pending);

    ISchemaRegistry& registry_;
};

} // namespace SalKafka
