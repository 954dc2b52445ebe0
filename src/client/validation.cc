#include "validation.h"

#include "../common/errors.h"

namespace SalKafka {

namespace {

struct NamedValidation {
	const char* name;
	ValidationType type;
};

constexpr NamedValidation kValidationTypes[] = {
	{"none", ValidationType::kNone},
	{"custom", ValidationType::kCustom},
	{"dataclass", ValidationType::kDataclass},
	{"dataclass_and_decode", ValidationType::kDataclassAndDecode},
	{"pydantic", ValidationType::kPydantic},
	{"pydantic_and_decode", ValidationType::kPydanticAndDecode},
};

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

ValidationType ParseValidationType(const std::string& name) {
	for (const auto& entry : kValidationTypes) {
		if (name == entry.name) return entry.type;
	}
	std::string choices;
	for (const auto& entry : kValidationTypes) {
		choices += (choices.empty() ? "" : ", ") + std::string(entry.name);
	}
	throw ConfigurationError("Unsupported validation " + name + "; choose one of " + choices);
}

const char* ValidationTypeName(ValidationType type) {
	for (const auto& entry : kValidationTypes) {
		if (type == entry.type) return entry.name;
	}
	return "unknown";
}

std::vector<std::string> ValidationTypeNames() {
	std::vector<std::string> names;
	for (const auto& entry : kValidationTypes) names.emplace_back(entry.name);
	return names;
}

ValidationStrategy MakeValidationStrategy(ValidationType type, const TopicDescriptor& topic) {
	switch (type) {
		case ValidationType::kNone:
			return NoValidation{};
		case ValidationType::kCustom:
			return CustomValidation{FieldValidator(topic)};
		case ValidationType::kDataclass:
			return RecordValidation{&topic, false};
		case ValidationType::kDataclassAndDecode:
			return RecordValidation{&topic, true};
		case ValidationType::kPydantic:
			return ModelValidation{&topic, false};
		case ValidationType::kPydanticAndDecode:
			return ModelValidation{&topic, true};
	}
	throw ConfigurationError("Unsupported validation type");
}

const FieldMap& ApplyValidation(const ValidationStrategy& strategy, const FieldMap& data, FieldMap& scratch) {
	return std::visit(Overloaded{
		[&](const NoValidation&) -> const FieldMap& {
			return data;
		},
		[&](const CustomValidation& v) -> const FieldMap& {
			v.validator.Validate(data);
			return data;
		},
		[&](const RecordValidation& v) -> const FieldMap& {
			TopicRecord record(*v.topic, data);
			if (!v.decode) return data;
			scratch = record.ToFieldMap();
			return scratch;
		},
		[&](const ModelValidation& v) -> const FieldMap& {
			TopicModel model(*v.topic, data);
			if (!v.decode) return data;
			scratch = model.ToFieldMap();
			return scratch;
		},
	}, strategy);
}

} // namespace SalKafka
