#ifndef SALKAFKA_TOPIC_DESCRIPTOR_H_
#define SALKAFKA_TOPIC_DESCRIPTOR_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../codec/avro_schema.h"
#include "../common/field_value.h"

namespace SalKafka {

// Reserved fields every topic carries
inline constexpr char kSndStampField[] = "private_sndStamp";
inline constexpr char kRcvStampField[] = "private_rcvStamp";
inline constexpr char kSeqNumField[] = "private_seqNum";
inline constexpr char kOriginField[] = "private_origin";
inline constexpr char kIdentityField[] = "private_identity";
// Present only for indexed components
inline constexpr char kIndexField[] = "private_index";

/**
 * Typed description of one topic field
 */
struct FieldDescriptor {
    std::string name;
    FieldType type = FieldType::kDouble;
    // Number of elements; fields with count > 1 are arrays
    size_t count = 1;
    // Absent for kMap fields
    std::optional<FieldValue> default_value;
    std::string units;
    std::string description;

    bool is_array() const { return count > 1; }
};

/**
 * Everything the core knows about one topic. Immutable after load.
 */
struct TopicDescriptor {
    std::string component_name;
    // Attribute name used on the command line, e.g. evt_summaryState
    std::string logical_name;
    // SAL name, e.g. logevent_summaryState
    std::string sal_name;
    // Broker-facing topic name, e.g. lsst.sal.Test.logevent_summaryState
    std::string wire_name;
    // Schema registry subject, e.g. lsst.sal.Test.logevent_summaryState-value
    std::string subject;
    bool is_indexed = false;
    std::string description;
    // Private fields first, then the topic's own fields
    std::vector<FieldDescriptor> fields;
    std::shared_ptr<const AvroSchema> schema;

    const FieldDescriptor* FindField(const std::string& name) const {
        for (const auto& field : fields) {
            if (field.name == name) return &field;
        }
        return nullptr;
    }

    std::vector<std::string> FieldNames() const {
        std::vector<std::string> names;
        names.reserve(fields.size());
        for (const auto& field : fields) names.push_back(field.name);
        return names;
    }
};

/**
 * One component (a logical producer) and all of its topics, keyed by
 * logical name. Loaded once; read-only thereafter.
 */
struct ComponentDescriptor {
    std::string name;
    bool is_indexed = false;
    std::map<std::string, TopicDescriptor> topics;
};

} // namespace SalKafka

#endif // SALKAFKA_TOPIC_DESCRIPTOR_H_
