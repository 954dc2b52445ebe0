#ifndef SALKAFKA_AVRO_CODEC_H_
#define SALKAFKA_AVRO_CODEC_H_

#include <string>
#include <string_view>

#include "avro_schema.h"
#include "../common/field_value.h"

namespace SalKafka {

/**
 * Encode a record in Avro binary form, fields in schema order.
 * Integer values are accepted for float/double fields.
 * @throws CodecError if a field is missing or has the wrong type, or an
 *         int field is out of 32-bit range
 */
std::string EncodeAvro(const AvroSchema& schema, const FieldMap& fields);

/**
 * Decode an Avro binary record body written with the given schema.
 * @throws CodecError on truncated or malformed input
 */
FieldMap DecodeAvro(const AvroSchema& schema, std::string_view body);

} // namespace SalKafka

#endif // SALKAFKA_AVRO_CODEC_H_
