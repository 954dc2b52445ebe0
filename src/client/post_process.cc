#include "post_process.h"

#include "../common/errors.h"

namespace SalKafka {

namespace {

struct NamedPostProcess {
	const char* name;
	PostProcessType type;
};

constexpr NamedPostProcess kPostProcessTypes[] = {
	{"none", PostProcessType::kNone},
	{"dataclass", PostProcessType::kDataclass},
	{"pydantic", PostProcessType::kPydantic},
	{"simple_namespace", PostProcessType::kSimpleNamespace},
};

} // namespace

PostProcessType ParsePostProcessType(const std::string& name) {
	for (const auto& entry : kPostProcessTypes) {
		if (name == entry.name) return entry.type;
	}
	throw ConfigurationError("Unsupported value of postprocess: " + name);
}

const char* PostProcessTypeName(PostProcessType type) {
	for (const auto& entry : kPostProcessTypes) {
		if (type == entry.type) return entry.name;
	}
	return "unknown";
}

std::vector<std::string> PostProcessTypeNames() {
	std::vector<std::string> names;
	for (const auto& entry : kPostProcessTypes) names.emplace_back(entry.name);
	return names;
}

PostProcessStrategy MakePostProcessStrategy(PostProcessType type) {
	switch (type) {
		case PostProcessType::kNone: return NoPostProcess{};
		case PostProcessType::kDataclass: return RecordPostProcess{};
		case PostProcessType::kPydantic: return ModelPostProcess{};
		case PostProcessType::kSimpleNamespace: return AttributeBagPostProcess{};
	}
	throw ConfigurationError("Unsupported post-process type");
}

ProcessedMessage ApplyPostProcess(const PostProcessStrategy& strategy, const TopicDescriptor& topic,
		const FieldMap& data) {
	return std::visit([&](const auto& s) -> ProcessedMessage {
		using S = std::decay_t<decltype(s)>;
		if constexpr (std::is_same_v<S, RecordPostProcess>) {
			return TopicRecord(topic, data);
		} else if constexpr (std::is_same_v<S, ModelPostProcess>) {
			return TopicModel(topic, data);
		} else if constexpr (std::is_same_v<S, AttributeBagPostProcess>) {
			return AttributeBag(data);
		} else {
			return std::monostate{};
		}
	}, strategy);
}

std::string ToString(const ProcessedMessage& processed, const TopicDescriptor& topic, const FieldMap& data) {
	return std::visit([&](const auto& p) -> std::string {
		using P = std::decay_t<decltype(p)>;
		if constexpr (std::is_same_v<P, std::monostate>) {
			return SalKafka::ToString(data, topic.FieldNames());
		} else {
			return p.ToString();
		}
	}, processed);
}

} // namespace SalKafka
