#include "serializer.h"

#include <glog/logging.h>

#include "../codec/avro_codec.h"
#include "../codec/wire_format.h"
#include "../common/errors.h"

namespace SalKafka {

std::string Serializer::Serialize(const FieldMap& data) const {
    return wire::Frame(schema_id_, EncodeAvro(*schema_, data));
}

void Deserializer::AddSchema(int32_t schema_id, std::shared_ptr<const AvroSchema> schema) {
    absl::MutexLock lock(&mutex_);
    cache_[schema_id] = std::move(schema);
}

bool Deserializer::HasSchema(int32_t schema_id) const {
    return Lookup(schema_id) != nullptr;
}

std::shared_ptr<const AvroSchema> Deserializer::Lookup(int32_t schema_id) const {
    absl::MutexLock lock(&mutex_);
    auto it = cache_.find(schema_id);
    return it == cache_.end() ? nullptr : it->second;
}

std::shared_ptr<const AvroSchema> Deserializer::FetchSchema(int32_t schema_id) {
    if (auto schema = Lookup(schema_id)) return schema;
    if (!registry_) {
        throw RegistryError("unknown schema id " + std::to_string(schema_id));
    }
    // Fetched outside the lock; a concurrent fetch of the same id is harmless
    auto schema = std::make_shared<const AvroSchema>(registry_->GetSchema(schema_id));
    LOG(INFO) << "Fetched schema " << schema->FullName() << " with id " << schema_id;
    absl::MutexLock lock(&mutex_);
    return cache_.emplace(schema_id, std::move(schema)).first->second;
}

int32_t Deserializer::PeekSchemaId(std::string_view payload) {
    return wire::Unframe(payload).schema_id;
}

DeserializedMessage Deserializer::Deserialize(std::string_view payload) {
    wire::FramedPayload framed = wire::Unframe(payload);
    std::shared_ptr<const AvroSchema> schema = FetchSchema(framed.schema_id);
    DeserializedMessage message;
    message.schema_id = framed.schema_id;
    message.data = DecodeAvro(*schema, framed.body);
    return message;
}

} // namespace SalKafka
