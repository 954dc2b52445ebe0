#ifndef SALKAFKA_AVRO_SCHEMA_H_
#define SALKAFKA_AVRO_SCHEMA_H_

#include <optional>
#include <string>
#include <vector>

#include "../common/field_value.h"

namespace SalKafka {

/**
 * One field of an Avro record schema. Only the shapes a topic can declare
 * are supported: a primitive, an array of a primitive, or a map of strings.
 */
struct AvroField {
    std::string name;
    FieldType type = FieldType::kDouble;
    bool is_array = false;
    std::optional<FieldValue> default_value;
    std::string doc;
};

/**
 * Avro record schema for one topic. This is the binary wire schema handle
 * registered with the schema registry and used by the codec.
 */
class AvroSchema {
public:
    AvroSchema(std::string name, std::string name_space, std::vector<AvroField> fields);

    /**
     * Parse the JSON form returned by the schema registry
     * @throws CodecError if the JSON is malformed or uses an unsupported type
     */
    static AvroSchema Parse(const std::string& json);

    // Compact JSON form, suitable for registration
    std::string ToJson() const;

    const std::string& name() const { return name_; }
    const std::string& name_space() const { return name_space_; }
    std::string FullName() const;
    const std::vector<AvroField>& fields() const { return fields_; }

    // Field by name, nullptr if absent
    const AvroField* FindField(const std::string& name) const;

private:
    std::string name_;
    std::string name_space_;
    std::vector<AvroField> fields_;
};

} // namespace SalKafka

#endif // SALKAFKA_AVRO_SCHEMA_H_
