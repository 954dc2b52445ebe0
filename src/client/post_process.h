#pragma once

#include <string>
#include <variant>
#include <vector>

#include "../metadata/record_types.h"

namespace SalKafka {

/**
 * What the consumer builds from each decoded message
 */
enum class PostProcessType {
	kNone,
	kDataclass,
	kPydantic,
	kSimpleNamespace,
};

// @throws ConfigurationError for an unknown name
PostProcessType ParsePostProcessType(const std::string& name);
const char* PostProcessTypeName(PostProcessType type);
std::vector<std::string> PostProcessTypeNames();

struct NoPostProcess {};
struct RecordPostProcess {};
struct ModelPostProcess {};
struct AttributeBagPostProcess {};

using PostProcessStrategy =
	std::variant<NoPostProcess, RecordPostProcess, ModelPostProcess, AttributeBagPostProcess>;

PostProcessStrategy MakePostProcessStrategy(PostProcessType type);

// Derived representation of one message; monostate for "none"
using ProcessedMessage = std::variant<std::monostate, TopicRecord, TopicModel, AttributeBag>;

/**
 * Build the strategy's representation of data. data itself is not changed.
 * @throws ValidationError if data does not fit the topic's record type
 */
ProcessedMessage ApplyPostProcess(const PostProcessStrategy& strategy, const TopicDescriptor& topic,
		const FieldMap& data);

// Renders processed, or data when nothing was built
std::string ToString(const ProcessedMessage& processed, const TopicDescriptor& topic, const FieldMap& data);

} // namespace SalKafka
