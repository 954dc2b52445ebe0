#pragma once

#include <string>
#include <variant>
#include <vector>

#include "../metadata/record_types.h"

namespace SalKafka {

/**
 * How the producer checks each message before serializing it
 */
enum class ValidationType {
	kNone,
	kCustom,
	kDataclass,
	kDataclassAndDecode,
	kPydantic,
	kPydanticAndDecode,
};

// @throws ConfigurationError for an unknown name
ValidationType ParseValidationType(const std::string& name);
const char* ValidationTypeName(ValidationType type);
// Every accepted name, for help text
std::vector<std::string> ValidationTypeNames();

struct NoValidation {};

struct CustomValidation {
	FieldValidator validator;
};

// Construct a TopicRecord; with decode, send what it re-derives
struct RecordValidation {
	const TopicDescriptor* topic;
	bool decode;
};

// Construct a TopicModel; with decode, send what it re-derives
struct ModelValidation {
	const TopicDescriptor* topic;
	bool decode;
};

using ValidationStrategy = std::variant<NoValidation, CustomValidation, RecordValidation, ModelValidation>;

ValidationStrategy MakeValidationStrategy(ValidationType type, const TopicDescriptor& topic);

/**
 * Run the strategy on one message.
 * @param scratch Holds the re-derived message for the decode variants
 * @return The message to send: data itself, or scratch
 * @throws ValidationError if the message is rejected
 */
const FieldMap& ApplyValidation(const ValidationStrategy& strategy, const FieldMap& data, FieldMap& scratch);

} // namespace SalKafka
