#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "schema_registry.h"
#include "../codec/avro_schema.h"
#include "../common/field_value.h"

namespace SalKafka {

/**
 * Encodes messages of one topic: Avro body behind the Confluent header
 * carrying the registered schema id
 */
class Serializer {
public:
    Serializer(std::shared_ptr<const AvroSchema> schema, int32_t schema_id)
        : schema_(std::move(schema)), schema_id_(schema_id) {}

    // @throws CodecError if data does not match the schema
    std::string Serialize(const FieldMap& data) const;

    int32_t schema_id() const { return schema_id_; }
    const AvroSchema& schema() const { return *schema_; }

private:
    std::shared_ptr<const AvroSchema> schema_;
    int32_t schema_id_;
};

struct DeserializedMessage {
    int32_t schema_id = 0;
    FieldMap data;
};

/**
 * Decodes Confluent-framed messages of any topic. The schema id embedded in
 * each message is resolved through a local cache, which is filled from the
 * registry on first use of an id.
 */
class Deserializer {
public:
    // registry may be null, in which case only known schemas decode
    explicit Deserializer(ISchemaRegistry* registry) : registry_(registry) {}

    // Seed the cache, e.g. with a schema this process registered itself
    void AddSchema(int32_t schema_id, std::shared_ptr<const AvroSchema> schema);
    bool HasSchema(int32_t schema_id) const;

    /**
     * Fetch and cache the schema of id if it is not cached yet. Blocking.
     * @throws RegistryError if there is no registry or the lookup fails
     */
    std::shared_ptr<const AvroSchema> FetchSchema(int32_t schema_id);

    /**
     * @throws CodecError on a malformed payload
     * @throws RegistryError if the schema id cannot be resolved
     */
    DeserializedMessage Deserialize(std::string_view payload);

    // Schema id of a framed payload without decoding the body
    static int32_t PeekSchemaId(std::string_view payload);

private:
    std::shared_ptr<const AvroSchema> Lookup(int32_t schema_id) const;

    ISchemaRegistry* registry_;
    mutable absl::Mutex mutex_;
    absl::flat_hash_map<int32_t, std::shared_ptr<const AvroSchema>> cache_ ABSL_GUARDED_BY(mutex_);
};

} // namespace SalKafka
