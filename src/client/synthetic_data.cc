#include "synthetic_data.h"

#include "../common/errors.h"

namespace SalKafka {

FieldMap DeriveSyntheticData(const TopicDescriptor& topic) {
	FieldMap data;
	data.reserve(topic.fields.size());
	for (const auto& field : topic.fields) {
		const size_t n = field.count;
		switch (field.type) {
			case FieldType::kBoolean:
				if (field.is_array()) data[field.name] = std::vector<bool>(n, true);
				else data[field.name] = true;
				break;
			case FieldType::kInt:
			case FieldType::kLong:
				if (field.is_array()) data[field.name] = std::vector<int64_t>(n, kSyntheticInteger);
				else data[field.name] = kSyntheticInteger;
				break;
			case FieldType::kFloat:
			case FieldType::kDouble:
				if (field.is_array()) data[field.name] = std::vector<double>(n, kSyntheticFloat);
				else data[field.name] = kSyntheticFloat;
				break;
			case FieldType::kString:
				if (field.is_array()) {
					throw ConfigurationError("Unexpected array type for " + field.name + " in " +
							topic.logical_name + ": string[" + std::to_string(n) + "]");
				}
				data[field.name] = std::string(kSyntheticString);
				break;
			case FieldType::kMap:
				throw ConfigurationError("Unexpected scalar type for " + field.name + " in " +
						topic.logical_name + ": map");
		}
	}
	return data;
}

} // namespace SalKafka
